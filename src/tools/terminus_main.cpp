#include "terminus/lint/lint_errors.hpp"
#include "terminus/lint/lint_report.hpp"
#include "terminus/lint/lint_telemetry.hpp"
#include "terminus/lint/linter.hpp"
#include "terminus/syntax/dialect.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using terminus::lint::FixedFile;
using terminus::lint::LintConfig;
using terminus::lint::LintedFile;
using terminus::lint::Linter;
using terminus::lint::LintTelemetry;

namespace {

constexpr int kExitClean = 0;
constexpr int kExitViolations = 1;
constexpr int kExitUsage = 2;

struct CommonOptions final {
    std::string dialect = "ansi";
    std::vector<std::string> rules{};
    bool multiline_newline = false;
    bool require_final_semicolon = false;
    std::size_t fix_loop_limit = 10U;
    std::string format = "text";
    bool verbose = false;
    std::string log_json_path{};
};

std::string read_stdin()
{
    std::ostringstream buffer;
    buffer << std::cin.rdbuf();
    return buffer.str();
}

LintConfig make_lint_config(const CommonOptions& options)
{
    LintConfig config{};
    const auto dialect = terminus::syntax::parse_dialect(options.dialect);
    if (!dialect) {
        throw std::system_error{make_error_code(terminus::lint::LintErrc::UnknownDialect), options.dialect};
    }
    config.dialect = *dialect;
    config.rules.multiline_newline = options.multiline_newline;
    config.rules.require_final_semicolon = options.require_final_semicolon;
    config.enabled_rules = options.rules;
    config.fix_loop_limit = options.fix_loop_limit;
    return config;
}

class LinterSession final {
public:
    explicit LinterSession(const CommonOptions& options)
        : options_{options}
    {
        Linter::Config config{};
        config.lint = make_lint_config(options);
        config.telemetry = &telemetry_;
        if (options.verbose) {
            config.debug_logger = [](std::string_view message) {
                std::cerr << "[debug] " << message << '\n';
            };
        }

        if (!options.log_json_path.empty()) {
            if (options.log_json_path == "-") {
                log_stream_ = &std::cout;
            } else {
                auto file = std::make_unique<std::ofstream>(options.log_json_path, std::ios::out | std::ios::app);
                if (!file->is_open()) {
                    throw std::runtime_error{"failed to open log file '" + options.log_json_path + "'"};
                }
                log_stream_ = file.get();
                log_file_ = std::move(file);
            }
            config.result_logger = [this](const LintedFile& file) {
                const auto line = terminus::lint::format_lint_log_json(file);
                std::lock_guard<std::mutex> guard{log_mutex_};
                (*log_stream_) << line << '\n';
                log_stream_->flush();
            };
        }

        linter_ = std::make_unique<Linter>(std::move(config));
    }

    [[nodiscard]] const Linter& linter() const noexcept { return *linter_; }

    void report_telemetry() const
    {
        if (!options_.verbose) {
            return;
        }
        const auto snapshot = telemetry_.snapshot();
        std::cerr << "[debug] files=" << snapshot.files_attempted << " succeeded=" << snapshot.files_succeeded
                  << " parse_failures=" << snapshot.parse_failures << " violations=" << snapshot.violations
                  << " fixes_applied=" << snapshot.fixes_applied
                  << " total_ns=" << snapshot.total_lint_duration_ns << '\n';
    }

private:
    const CommonOptions& options_;
    LintTelemetry telemetry_{};
    std::unique_ptr<std::ofstream> log_file_{};
    std::ostream* log_stream_ = nullptr;
    std::mutex log_mutex_{};
    std::unique_ptr<Linter> linter_{};
};

void print_files(const std::vector<LintedFile>& files, const std::string& format)
{
    if (format == "json") {
        std::cout << terminus::lint::format_lint_report_json(files) << '\n';
        return;
    }

    for (const auto& file : files) {
        for (const auto& diagnostic : file.diagnostics) {
            std::cerr << terminus::lint::format_diagnostic_text(file.path, diagnostic) << '\n';
        }
        if (file.error) {
            std::cerr << file.path << ": error: " << file.error.message() << '\n';
        }
        for (const auto& violation : file.violations) {
            std::cout << terminus::lint::format_violation_text(file.path, violation) << '\n';
        }
    }
    std::cout << terminus::lint::format_lint_summary(files) << '\n';
}

int run_lint(const CommonOptions& options, const std::vector<std::string>& paths)
{
    LinterSession session{options};
    std::vector<LintedFile> files;
    files.reserve(paths.size());
    for (const auto& path : paths) {
        if (path == "-") {
            files.push_back(session.linter().lint_string(read_stdin(), "<stdin>"));
        } else {
            files.push_back(session.linter().lint_path(path));
        }
    }

    print_files(files, options.format);
    session.report_telemetry();

    for (const auto& file : files) {
        if (!file.clean()) {
            return kExitViolations;
        }
    }
    return kExitClean;
}

int run_fix(const CommonOptions& options, const std::vector<std::string>& paths, bool to_stdout)
{
    LinterSession session{options};
    std::vector<LintedFile> remaining;
    remaining.reserve(paths.size());
    int exit_code = kExitClean;

    for (const auto& path : paths) {
        FixedFile fixed{};
        if (path == "-") {
            fixed = session.linter().fix_string(read_stdin(), "<stdin>");
            std::cout << fixed.fixed;
        } else {
            fixed = session.linter().fix_path(path, !to_stdout);
            if (to_stdout) {
                std::cout << fixed.fixed;
            }
        }

        if (options.format == "text" && fixed.changed()) {
            std::cerr << fixed.path << ": applied " << fixed.fixes_applied << " fix(es) in " << fixed.loops
                      << " pass(es)" << '\n';
        }

        LintedFile summary{};
        summary.path = fixed.path;
        summary.source = fixed.fixed;
        summary.violations = std::move(fixed.remaining);
        summary.diagnostics = std::move(fixed.diagnostics);
        summary.error = fixed.error;
        if (!summary.clean()) {
            exit_code = kExitViolations;
        }
        remaining.push_back(std::move(summary));
    }

    if (options.format == "json") {
        std::cerr << terminus::lint::format_lint_report_json(remaining) << '\n';
    } else {
        for (const auto& file : remaining) {
            for (const auto& diagnostic : file.diagnostics) {
                std::cerr << terminus::lint::format_diagnostic_text(file.path, diagnostic) << '\n';
            }
            if (file.error) {
                std::cerr << file.path << ": error: " << file.error.message() << '\n';
            }
            for (const auto& violation : file.violations) {
                std::cerr << terminus::lint::format_violation_text(file.path, violation) << '\n';
            }
        }
    }
    session.report_telemetry();
    return exit_code;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Statement terminator linter for SQL files"};
    app.require_subcommand(1);
    app.set_config("--config", ".terminus.toml", "Read options from a TOML configuration file");

    CommonOptions options{};
    app.add_option("--dialect", options.dialect, "SQL dialect (ansi or oracle)")
        ->transform(CLI::CheckedTransformer({{"ansi", "ansi"}, {"oracle", "oracle"}}, CLI::ignore_case));
    app.add_option("--rules", options.rules, "Comma separated rule codes or names to run (default: all)")
        ->delimiter(',');
    app.add_flag("--multiline-newline", options.multiline_newline,
                 "Place the terminator of a multi-line statement on its own line");
    app.add_flag("--require-final-semicolon", options.require_final_semicolon,
                 "Require a terminator after the last statement of the file");
    app.add_option("--fix-loop-limit", options.fix_loop_limit, "Maximum number of fix passes per file")
        ->check(CLI::PositiveNumber);
    app.add_option("-f,--format", options.format, "Output format (text or json)")
        ->transform(CLI::CheckedTransformer({{"text", "text"}, {"json", "json"}}));
    app.add_flag("-v,--verbose", options.verbose, "Print debug output on stderr");
    app.add_option("--log-json", options.log_json_path, "Write one JSON line per linted file (use '-' for stdout)");

    int exit_code = kExitClean;

    std::vector<std::string> lint_paths;
    auto* lint = app.add_subcommand("lint", "Report terminator violations");
    lint->fallthrough();
    lint->add_option("paths", lint_paths, "SQL files to lint (use '-' for stdin)")->required();
    lint->callback([&]() { exit_code = run_lint(options, lint_paths); });

    std::vector<std::string> fix_paths;
    bool fix_to_stdout = false;
    auto* fix = app.add_subcommand("fix", "Rewrite files with terminator fixes applied");
    fix->fallthrough();
    fix->add_option("paths", fix_paths, "SQL files to fix in place (use '-' for stdin)")->required();
    fix->add_flag("--stdout", fix_to_stdout, "Print the fixed SQL instead of rewriting the files");
    fix->callback([&]() { exit_code = run_fix(options, fix_paths, fix_to_stdout); });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        const auto code = app.exit(error);
        return code == 0 ? kExitClean : kExitUsage;
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return exit_code;
}
