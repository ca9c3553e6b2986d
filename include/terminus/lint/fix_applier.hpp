#pragma once

#include "terminus/rules/lint_fix.hpp"
#include "terminus/syntax/syntax_tree.hpp"

#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

namespace terminus::lint {

struct FixApplication final {
    std::string source{};
    std::size_t applied = 0U;
    std::error_code error{};

    [[nodiscard]] bool success() const noexcept { return !error; }
};

// True when two fixes delete or replace the same node, when a deleted or
// replaced node carries any other fix, or when an anchor is not in the tree.
[[nodiscard]] bool fixes_conflict(const syntax::SyntaxTree& tree, const std::vector<rules::LintFix>& fixes);

// Renders `tree` with `fixes` applied. A conflicting set is refused with
// LintErrc::FixConflict and the unmodified source.
[[nodiscard]] FixApplication apply_fixes(const syntax::SyntaxTree& tree, const std::vector<rules::LintFix>& fixes);

}  // namespace terminus::lint
