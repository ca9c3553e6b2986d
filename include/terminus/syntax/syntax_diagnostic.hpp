#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace terminus::syntax {

enum class SyntaxSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct SyntaxDiagnostic final {
    SyntaxSeverity severity = SyntaxSeverity::Error;
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::string excerpt{};
    std::vector<std::string> remediation_hints{};
};

}  // namespace terminus::syntax
