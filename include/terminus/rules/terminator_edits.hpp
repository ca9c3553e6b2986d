#pragma once

#include "terminus/rules/lint_fix.hpp"
#include "terminus/syntax/segments.hpp"

#include <optional>
#include <vector>

namespace terminus::rules {

// Moves `target` after `anchor`: create the new segments there, delete the
// target and the whitespace that separated it from the anchor. When the
// resolved anchor is itself slated for deletion it is replaced instead.
[[nodiscard]] std::vector<LintFix> create_and_delete(const syntax::SyntaxTree& tree,
                                                     NodeId root,
                                                     NodeId target,
                                                     NodeId anchor,
                                                     const syntax::Segments& whitespace_deletions,
                                                     std::vector<NewSegment> create);

struct RepeatedTerminators final {
    LintResult result{};
    // Terminators after the first one, in source order.
    std::vector<NodeId> collapsed{};
};

// Scans the siblings following `terminator` for further ";" terminators
// separated only by whitespace. Empty when the terminator stands alone.
[[nodiscard]] std::optional<RepeatedTerminators> collapse_repeated_terminators(const syntax::SyntaxTree& tree,
                                                                              NodeId terminator);

}  // namespace terminus::rules
