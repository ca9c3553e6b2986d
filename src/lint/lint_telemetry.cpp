#include "terminus/lint/lint_telemetry.hpp"

namespace terminus::lint {

void LintTelemetry::add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept
{
    target.fetch_add(value, std::memory_order_relaxed);
}

void LintTelemetry::record_file_attempt() noexcept
{
    add_relaxed(files_attempted_, 1U);
}

void LintTelemetry::record_file_result(bool success,
                                       bool parse_failed,
                                       std::uint64_t lint_duration_ns,
                                       std::size_t violations) noexcept
{
    if (success) {
        add_relaxed(files_succeeded_, 1U);
    }
    if (parse_failed) {
        add_relaxed(parse_failures_, 1U);
    }

    add_relaxed(violations_, static_cast<std::uint64_t>(violations));
    add_relaxed(total_lint_duration_ns_, lint_duration_ns);
    last_lint_duration_ns_.store(lint_duration_ns, std::memory_order_relaxed);
}

void LintTelemetry::record_fixes_applied(std::size_t fixes) noexcept
{
    add_relaxed(fixes_applied_, static_cast<std::uint64_t>(fixes));
}

LintTelemetrySnapshot LintTelemetry::snapshot() const noexcept
{
    LintTelemetrySnapshot snapshot{};
    snapshot.files_attempted = files_attempted_.load(std::memory_order_relaxed);
    snapshot.files_succeeded = files_succeeded_.load(std::memory_order_relaxed);
    snapshot.parse_failures = parse_failures_.load(std::memory_order_relaxed);
    snapshot.violations = violations_.load(std::memory_order_relaxed);
    snapshot.fixes_applied = fixes_applied_.load(std::memory_order_relaxed);
    snapshot.total_lint_duration_ns = total_lint_duration_ns_.load(std::memory_order_relaxed);
    snapshot.last_lint_duration_ns = last_lint_duration_ns_.load(std::memory_order_relaxed);
    return snapshot;
}

void LintTelemetry::reset() noexcept
{
    files_attempted_.store(0U, std::memory_order_relaxed);
    files_succeeded_.store(0U, std::memory_order_relaxed);
    parse_failures_.store(0U, std::memory_order_relaxed);
    violations_.store(0U, std::memory_order_relaxed);
    fixes_applied_.store(0U, std::memory_order_relaxed);
    total_lint_duration_ns_.store(0U, std::memory_order_relaxed);
    last_lint_duration_ns_.store(0U, std::memory_order_relaxed);
}

}  // namespace terminus::lint
