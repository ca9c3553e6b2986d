#include "terminus/lint/lint_errors.hpp"

#include <string>

namespace terminus::lint {

namespace {

class LintErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "terminus.lint";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<LintErrc>(condition)) {
        case LintErrc::Success:
            return "success";
        case LintErrc::ParseFailed:
            return "sql could not be tokenized";
        case LintErrc::UnknownDialect:
            return "unknown dialect";
        case LintErrc::UnknownRule:
            return "unknown rule";
        case LintErrc::FileReadFailed:
            return "file could not be read";
        case LintErrc::FileWriteFailed:
            return "file could not be written";
        case LintErrc::FixConflict:
            return "conflicting fixes";
        case LintErrc::FixLoopLimit:
            return "fix loop limit reached";
        default:
            return "unknown lint error";
        }
    }
};

const LintErrorCategory kCategory{};

}  // namespace

const std::error_category& lint_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(LintErrc value) noexcept
{
    return {static_cast<int>(value), lint_error_category()};
}

}  // namespace terminus::lint
