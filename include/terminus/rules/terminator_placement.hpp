#pragma once

#include "terminus/rules/rule.hpp"
#include "terminus/syntax/segments.hpp"

#include <optional>

namespace terminus::rules {

struct PlacementContext final {
    // Where edits attach: the trivia node furthest from the terminator, or the
    // terminator itself when nothing separates it from the preceding code.
    NodeId anchor = syntax::kInvalidNode;
    bool is_one_line = false;
    // Non-meta trivia between the preceding code and the terminator, nearest
    // to the terminator first.
    syntax::Segments preceding_trivia;
    syntax::Segments whitespace_deletions;
};

struct CommentAdjustment final {
    syntax::Segments preceding_trivia;
    NodeId anchor = syntax::kInvalidNode;
};

// Nearest statement owning `segment` (the segment itself included), walking
// down from `root`.
[[nodiscard]] std::optional<NodeId> find_statement(const syntax::SyntaxTree& tree, NodeId root, NodeId segment);

// False when no owning statement exists.
[[nodiscard]] bool is_one_line_statement(const syntax::SyntaxTree& tree, NodeId root, NodeId segment);

[[nodiscard]] PlacementContext analyze_placement(const RuleContext& context, NodeId terminator);

// An inline comment on the line where the preceding code ends becomes the
// anchor; trivia from that comment onwards is dropped.
[[nodiscard]] CommentAdjustment handle_preceding_inline_comments(const syntax::Segments& preceding_trivia,
                                                                 NodeId anchor);

// An inline comment that follows the anchor on the line where the anchor ends
// replaces it. Only trivia and `target` may sit between them; code of another
// statement stops the scan.
[[nodiscard]] NodeId handle_trailing_inline_comments(const syntax::SyntaxTree& tree,
                                                     NodeId anchor,
                                                     NodeId target = syntax::kInvalidNode);

}  // namespace terminus::rules
