#pragma once

#include "terminus/syntax/syntax_tree.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace terminus::syntax {

using SegmentPredicate = std::function<bool(const SyntaxTree&, NodeId)>;

namespace predicates {

[[nodiscard]] SegmentPredicate is_code();
[[nodiscard]] SegmentPredicate is_meta();
[[nodiscard]] SegmentPredicate is_comment();
[[nodiscard]] SegmentPredicate is_whitespace();
[[nodiscard]] SegmentPredicate is_type(SegmentKind kind);
[[nodiscard]] SegmentPredicate raw_is(std::string raw);
[[nodiscard]] SegmentPredicate not_(SegmentPredicate predicate);
[[nodiscard]] SegmentPredicate and_(SegmentPredicate lhs, SegmentPredicate rhs);
[[nodiscard]] SegmentPredicate or_(SegmentPredicate lhs, SegmentPredicate rhs);

}  // namespace predicates

struct SelectOptions final {
    SegmentPredicate select_if{};
    SegmentPredicate loop_while{};
    std::optional<NodeId> start{};
    std::optional<NodeId> stop{};
};

// Ordered view over nodes of one tree. A reversed view keeps reversed order in
// everything derived from it.
class Segments final {
public:
    using const_iterator = std::vector<NodeId>::const_iterator;

    explicit Segments(const SyntaxTree& tree, std::vector<NodeId> nodes = {});

    [[nodiscard]] static Segments children_of(const SyntaxTree& tree, NodeId parent);
    [[nodiscard]] static Segments raw_segments_of(const SyntaxTree& tree, NodeId parent);

    [[nodiscard]] const SyntaxTree& tree() const noexcept { return *tree_; }
    [[nodiscard]] const std::vector<NodeId>& ids() const noexcept { return nodes_; }
    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
    [[nodiscard]] NodeId operator[](std::size_t index) const { return nodes_.at(index); }
    [[nodiscard]] NodeId front() const { return nodes_.at(0U); }
    [[nodiscard]] NodeId back() const { return nodes_.at(nodes_.size() - 1U); }
    [[nodiscard]] const_iterator begin() const noexcept { return nodes_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return nodes_.end(); }

    [[nodiscard]] bool contains(NodeId id) const noexcept;
    [[nodiscard]] std::optional<std::size_t> index_of(NodeId id) const noexcept;

    [[nodiscard]] Segments reversed() const;
    [[nodiscard]] Segments select(const SelectOptions& options) const;
    [[nodiscard]] Segments select(const SegmentPredicate& select_if) const;
    [[nodiscard]] Segments first(const SegmentPredicate& predicate = {}) const;
    [[nodiscard]] Segments last(const SegmentPredicate& predicate = {}) const;
    [[nodiscard]] Segments head(std::size_t count) const;
    [[nodiscard]] Segments without(NodeId id) const;
    [[nodiscard]] bool any(const SegmentPredicate& predicate = {}) const;
    [[nodiscard]] bool all(const SegmentPredicate& predicate = {}) const;

private:
    const SyntaxTree* tree_;
    std::vector<NodeId> nodes_{};
};

}  // namespace terminus::syntax
