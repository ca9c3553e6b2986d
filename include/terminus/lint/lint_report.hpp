#pragma once

#include "terminus/lint/linter.hpp"

#include <string>
#include <vector>

namespace terminus::lint {

// "path:line:column: CODE description"
[[nodiscard]] std::string format_violation_text(const std::string& path, const Violation& violation);

[[nodiscard]] std::string format_diagnostic_text(const std::string& path, const syntax::SyntaxDiagnostic& diagnostic);

// "N violations in M files"
[[nodiscard]] std::string format_lint_summary(const std::vector<LintedFile>& files);

[[nodiscard]] std::string format_lint_report_json(const std::vector<LintedFile>& files);

// One JSON object on a single line, for the JSON-Lines log.
[[nodiscard]] std::string format_lint_log_json(const LintedFile& file);

}  // namespace terminus::lint
