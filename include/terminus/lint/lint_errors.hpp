#pragma once

#include <system_error>

namespace terminus::lint {

enum class LintErrc {
    Success = 0,
    ParseFailed,
    UnknownDialect,
    UnknownRule,
    FileReadFailed,
    FileWriteFailed,
    FixConflict,
    FixLoopLimit
};

const std::error_category& lint_error_category() noexcept;
std::error_code make_error_code(LintErrc value) noexcept;

}  // namespace terminus::lint

namespace std {

template <>
struct is_error_code_enum<terminus::lint::LintErrc> : true_type {
};

}  // namespace std
