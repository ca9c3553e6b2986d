#pragma once

#include "terminus/lint/lint_telemetry.hpp"
#include "terminus/rules/rule.hpp"
#include "terminus/syntax/dialect.hpp"
#include "terminus/syntax/syntax_diagnostic.hpp"
#include "terminus/syntax/syntax_tree.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace terminus::lint {

struct LintConfig final {
    syntax::Dialect dialect = syntax::Dialect::Ansi;
    rules::RuleOptions rules{};
    // Rule codes or names; empty enables every registered rule.
    std::vector<std::string> enabled_rules{};
    std::size_t fix_loop_limit = 10U;
};

struct Violation final {
    std::string code{};
    std::string name{};
    std::string description{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::vector<rules::LintFix> fixes{};

    [[nodiscard]] bool fixable() const noexcept { return !fixes.empty(); }
};

struct LintedFile final {
    std::string path{};
    std::string source{};
    std::vector<Violation> violations{};
    std::vector<syntax::SyntaxDiagnostic> diagnostics{};
    std::error_code error{};
    double duration_ms = 0.0;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};

    [[nodiscard]] bool success() const noexcept { return !error; }
    [[nodiscard]] bool clean() const noexcept { return !error && violations.empty(); }
};

struct FixedFile final {
    std::string path{};
    std::string original{};
    std::string fixed{};
    std::size_t loops = 0U;
    std::size_t fixes_applied = 0U;
    std::vector<Violation> remaining{};
    std::vector<syntax::SyntaxDiagnostic> diagnostics{};
    std::error_code error{};

    [[nodiscard]] bool success() const noexcept { return !error; }
    [[nodiscard]] bool changed() const noexcept { return original != fixed; }
};

class Linter final {
public:
    struct Config final {
        LintConfig lint{};
        LintTelemetry* telemetry = nullptr;
        std::function<void(std::string_view)> debug_logger{};
        std::function<void(const LintedFile&)> result_logger{};
    };

    Linter();
    // Throws std::system_error (LintErrc::UnknownRule) for an unknown entry in
    // `enabled_rules`.
    explicit Linter(Config config);

    [[nodiscard]] LintedFile lint_string(std::string_view sql, std::string path = "<string>") const;
    [[nodiscard]] FixedFile fix_string(std::string_view sql, std::string path = "<string>") const;

    [[nodiscard]] LintedFile lint_path(const std::filesystem::path& path) const;
    [[nodiscard]] FixedFile fix_path(const std::filesystem::path& path, bool write_back) const;

    [[nodiscard]] const std::vector<rules::RulePtr>& active_rules() const noexcept { return active_rules_; }
    [[nodiscard]] const LintConfig& config() const noexcept { return config_.lint; }

private:
    struct Evaluation final {
        std::optional<syntax::SyntaxTree> tree{};
        std::vector<std::pair<rules::RulePtr, rules::LintResult>> results{};
        std::vector<syntax::SyntaxDiagnostic> diagnostics{};
        std::error_code error{};
    };

    [[nodiscard]] Evaluation evaluate(std::string_view sql) const;
    [[nodiscard]] std::vector<Violation> to_violations(const Evaluation& evaluation) const;
    void finish(LintedFile& file, std::chrono::steady_clock::time_point started, std::size_t fixes_applied) const;
    void debug(std::string_view message) const;

    Config config_{};
    rules::RuleRegistry registry_{};
    std::vector<rules::RulePtr> active_rules_{};
};

}  // namespace terminus::lint
