#include "terminus/lint/linter.hpp"

#include "terminus/lint/fix_applier.hpp"
#include "terminus/lint/lint_errors.hpp"
#include "terminus/syntax/tree_builder.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace terminus::lint {

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path)
{
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool write_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream stream(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream) {
        return false;
    }
    stream.write(content.data(), static_cast<std::streamsize>(content.size()));
    stream.flush();
    return static_cast<bool>(stream);
}

bool has_fixable_result(const std::vector<Violation>& violations)
{
    return std::any_of(violations.begin(), violations.end(), [](const Violation& violation) {
        return violation.fixable();
    });
}

}  // namespace

Linter::Linter()
    : Linter(Config{})
{
}

Linter::Linter(Config config)
    : config_{std::move(config)}
    , registry_{rules::make_default_registry(config_.lint.rules)}
{
    if (config_.lint.enabled_rules.empty()) {
        active_rules_ = registry_.rules();
        return;
    }

    for (const auto& entry : config_.lint.enabled_rules) {
        auto rule = registry_.find(entry);
        if (!rule) {
            throw std::system_error{make_error_code(LintErrc::UnknownRule), entry};
        }
        if (std::find(active_rules_.begin(), active_rules_.end(), rule) == active_rules_.end()) {
            active_rules_.push_back(std::move(rule));
        }
    }
}

LintedFile Linter::lint_string(std::string_view sql, std::string path) const
{
    const auto started = std::chrono::steady_clock::now();
    LintedFile file{};
    file.path = std::move(path);
    file.source = std::string{sql};
    file.started_at = std::chrono::system_clock::now();
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_file_attempt();
    }

    auto evaluation = evaluate(sql);
    file.diagnostics = std::move(evaluation.diagnostics);
    file.error = evaluation.error;
    if (evaluation.tree) {
        file.violations = to_violations(evaluation);
    }

    finish(file, started, 0U);
    return file;
}

FixedFile Linter::fix_string(std::string_view sql, std::string path) const
{
    const auto started = std::chrono::steady_clock::now();
    FixedFile fixed{};
    fixed.path = std::move(path);
    fixed.original = std::string{sql};
    fixed.fixed = fixed.original;

    LintedFile summary{};
    summary.path = fixed.path;
    summary.started_at = std::chrono::system_clock::now();
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_file_attempt();
    }

    for (;;) {
        auto evaluation = evaluate(fixed.fixed);
        fixed.diagnostics = std::move(evaluation.diagnostics);
        if (!evaluation.tree) {
            fixed.error = evaluation.error;
            break;
        }
        fixed.remaining = to_violations(evaluation);
        if (!has_fixable_result(fixed.remaining)) {
            break;
        }
        if (fixed.loops >= config_.lint.fix_loop_limit) {
            debug("fix loop limit reached for " + fixed.path);
            fixed.error = make_error_code(LintErrc::FixLoopLimit);
            break;
        }

        std::vector<rules::LintFix> accepted;
        for (const auto& [rule, result] : evaluation.results) {
            if (result.fixes.empty()) {
                continue;
            }
            auto candidate = accepted;
            candidate.insert(candidate.end(), result.fixes.begin(), result.fixes.end());
            if (fixes_conflict(*evaluation.tree, candidate)) {
                debug(std::string{rule->code()} + ": fix deferred to the next pass");
                continue;
            }
            accepted = std::move(candidate);
        }

        auto application = apply_fixes(*evaluation.tree, accepted);
        if (!application.success()) {
            fixed.error = application.error;
            break;
        }
        ++fixed.loops;
        fixed.fixes_applied += application.applied;
        if (application.source == fixed.fixed) {
            break;
        }
        fixed.fixed = std::move(application.source);
    }

    summary.source = fixed.fixed;
    summary.violations = fixed.remaining;
    summary.diagnostics = fixed.diagnostics;
    summary.error = fixed.error;
    finish(summary, started, fixed.fixes_applied);
    return fixed;
}

LintedFile Linter::lint_path(const std::filesystem::path& path) const
{
    const auto source = read_file(path);
    if (!source) {
        LintedFile file{};
        file.path = path.string();
        file.error = make_error_code(LintErrc::FileReadFailed);
        file.started_at = std::chrono::system_clock::now();
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_file_attempt();
        }
        finish(file, std::chrono::steady_clock::now(), 0U);
        return file;
    }
    return lint_string(*source, path.string());
}

FixedFile Linter::fix_path(const std::filesystem::path& path, bool write_back) const
{
    const auto source = read_file(path);
    if (!source) {
        FixedFile fixed{};
        fixed.path = path.string();
        fixed.error = make_error_code(LintErrc::FileReadFailed);
        return fixed;
    }

    auto fixed = fix_string(*source, path.string());
    const auto writable = fixed.success() || fixed.error == LintErrc::FixLoopLimit;
    if (write_back && writable && fixed.changed()) {
        if (!write_file(path, fixed.fixed)) {
            fixed.error = make_error_code(LintErrc::FileWriteFailed);
        }
    }
    return fixed;
}

Linter::Evaluation Linter::evaluate(std::string_view sql) const
{
    Evaluation evaluation{};
    auto parsed = syntax::parse_sql(sql, config_.lint.dialect);
    evaluation.diagnostics = std::move(parsed.diagnostics);
    if (!parsed.success()) {
        evaluation.error = make_error_code(LintErrc::ParseFailed);
        return evaluation;
    }
    evaluation.tree = std::move(parsed.tree);

    for (const auto& rule : active_rules_) {
        rules::DebugLogger logger{};
        if (config_.debug_logger) {
            logger = [this, code = std::string{rule->code()}](std::string_view message) {
                config_.debug_logger(code + ": " + std::string{message});
            };
        }
        const rules::RuleContext context{*evaluation.tree, config_.lint.dialect, std::move(logger)};
        for (auto& result : rule->evaluate(context)) {
            evaluation.results.emplace_back(rule, std::move(result));
        }
    }
    return evaluation;
}

std::vector<Violation> Linter::to_violations(const Evaluation& evaluation) const
{
    std::vector<Violation> violations;
    violations.reserve(evaluation.results.size());
    for (const auto& [rule, result] : evaluation.results) {
        Violation violation{};
        violation.code = std::string{rule->code()};
        violation.name = std::string{rule->name()};
        violation.description = result.description.empty() ? std::string{rule->description()} : result.description;
        if (evaluation.tree->contains(result.anchor)) {
            const auto position = evaluation.tree->position(result.anchor);
            violation.line = position.line;
            violation.column = position.column;
        }
        violation.fixes = result.fixes;
        violations.push_back(std::move(violation));
    }

    std::stable_sort(violations.begin(), violations.end(), [](const Violation& lhs, const Violation& rhs) {
        if (lhs.line != rhs.line) {
            return lhs.line < rhs.line;
        }
        if (lhs.column != rhs.column) {
            return lhs.column < rhs.column;
        }
        return lhs.code < rhs.code;
    });
    return violations;
}

void Linter::finish(LintedFile& file, std::chrono::steady_clock::time_point started, std::size_t fixes_applied) const
{
    const auto elapsed = std::chrono::steady_clock::now() - started;
    file.finished_at = std::chrono::system_clock::now();
    file.duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();

    if (config_.telemetry != nullptr) {
        const auto elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
        config_.telemetry->record_file_result(file.success(),
                                              file.error == LintErrc::ParseFailed,
                                              static_cast<std::uint64_t>(elapsed_ns),
                                              file.violations.size());
        config_.telemetry->record_fixes_applied(fixes_applied);
    }

    debug(file.path + ": " + std::to_string(file.violations.size()) + " violation(s)");
    if (config_.result_logger) {
        config_.result_logger(file);
    }
}

void Linter::debug(std::string_view message) const
{
    if (config_.debug_logger) {
        config_.debug_logger(message);
    }
}

}  // namespace terminus::lint
