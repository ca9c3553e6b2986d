#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace terminus::lint {

struct LintTelemetrySnapshot final {
    std::uint64_t files_attempted = 0U;
    std::uint64_t files_succeeded = 0U;
    std::uint64_t parse_failures = 0U;
    std::uint64_t violations = 0U;
    std::uint64_t fixes_applied = 0U;
    std::uint64_t total_lint_duration_ns = 0U;
    std::uint64_t last_lint_duration_ns = 0U;
};

class LintTelemetry final {
public:
    void record_file_attempt() noexcept;
    void record_file_result(bool success, bool parse_failed, std::uint64_t lint_duration_ns, std::size_t violations) noexcept;
    void record_fixes_applied(std::size_t fixes) noexcept;

    [[nodiscard]] LintTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static void add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept;

    std::atomic<std::uint64_t> files_attempted_{0U};
    std::atomic<std::uint64_t> files_succeeded_{0U};
    std::atomic<std::uint64_t> parse_failures_{0U};
    std::atomic<std::uint64_t> violations_{0U};
    std::atomic<std::uint64_t> fixes_applied_{0U};
    std::atomic<std::uint64_t> total_lint_duration_ns_{0U};
    std::atomic<std::uint64_t> last_lint_duration_ns_{0U};
};

}  // namespace terminus::lint
