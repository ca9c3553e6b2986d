#include "terminus/lint/lint_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <system_error>

using namespace terminus::lint;

TEST_CASE("LintErrc converts to error codes in the lint category")
{
    const std::error_code code = LintErrc::FixConflict;
    CHECK(code.category() == lint_error_category());
    CHECK(std::string{code.category().name()} == "terminus.lint");
    CHECK(code == LintErrc::FixConflict);
    CHECK(code != LintErrc::FixLoopLimit);
    CHECK(static_cast<bool>(code));

    CHECK_FALSE(static_cast<bool>(make_error_code(LintErrc::Success)));
}

TEST_CASE("LintErrc messages describe each failure")
{
    CHECK(make_error_code(LintErrc::Success).message() == "success");
    CHECK(make_error_code(LintErrc::ParseFailed).message() == "sql could not be tokenized");
    CHECK(make_error_code(LintErrc::UnknownDialect).message() == "unknown dialect");
    CHECK(make_error_code(LintErrc::UnknownRule).message() == "unknown rule");
    CHECK(make_error_code(LintErrc::FileReadFailed).message() == "file could not be read");
    CHECK(make_error_code(LintErrc::FileWriteFailed).message() == "file could not be written");
    CHECK(make_error_code(LintErrc::FixConflict).message() == "conflicting fixes");
    CHECK(make_error_code(LintErrc::FixLoopLimit).message() == "fix loop limit reached");
}
