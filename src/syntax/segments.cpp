#include "terminus/syntax/segments.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace terminus::syntax {

namespace predicates {

SegmentPredicate is_code()
{
    return [](const SyntaxTree& tree, NodeId id) { return tree.is_code(id); };
}

SegmentPredicate is_meta()
{
    return [](const SyntaxTree& tree, NodeId id) { return tree.is_meta(id); };
}

SegmentPredicate is_comment()
{
    return [](const SyntaxTree& tree, NodeId id) { return tree.is_comment(id); };
}

SegmentPredicate is_whitespace()
{
    return [](const SyntaxTree& tree, NodeId id) { return tree.is_whitespace(id); };
}

SegmentPredicate is_type(SegmentKind kind)
{
    return [kind](const SyntaxTree& tree, NodeId id) { return tree.is_type(id, kind); };
}

SegmentPredicate raw_is(std::string raw)
{
    return [raw = std::move(raw)](const SyntaxTree& tree, NodeId id) { return tree.raw(id) == raw; };
}

SegmentPredicate not_(SegmentPredicate predicate)
{
    return [predicate = std::move(predicate)](const SyntaxTree& tree, NodeId id) { return !predicate(tree, id); };
}

SegmentPredicate and_(SegmentPredicate lhs, SegmentPredicate rhs)
{
    return [lhs = std::move(lhs), rhs = std::move(rhs)](const SyntaxTree& tree, NodeId id) {
        return lhs(tree, id) && rhs(tree, id);
    };
}

SegmentPredicate or_(SegmentPredicate lhs, SegmentPredicate rhs)
{
    return [lhs = std::move(lhs), rhs = std::move(rhs)](const SyntaxTree& tree, NodeId id) {
        return lhs(tree, id) || rhs(tree, id);
    };
}

}  // namespace predicates

Segments::Segments(const SyntaxTree& tree, std::vector<NodeId> nodes)
    : tree_{&tree}
    , nodes_{std::move(nodes)}
{
}

Segments Segments::children_of(const SyntaxTree& tree, NodeId parent)
{
    const auto children = tree.children(parent);
    return Segments{tree, std::vector<NodeId>(children.begin(), children.end())};
}

Segments Segments::raw_segments_of(const SyntaxTree& tree, NodeId parent)
{
    return Segments{tree, tree.raw_segments(parent)};
}

bool Segments::contains(NodeId id) const noexcept
{
    return std::find(nodes_.begin(), nodes_.end(), id) != nodes_.end();
}

std::optional<std::size_t> Segments::index_of(NodeId id) const noexcept
{
    const auto it = std::find(nodes_.begin(), nodes_.end(), id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(nodes_.begin(), it));
}

Segments Segments::reversed() const
{
    return Segments{*tree_, std::vector<NodeId>(nodes_.rbegin(), nodes_.rend())};
}

Segments Segments::select(const SelectOptions& options) const
{
    std::size_t begin = 0U;
    if (options.start) {
        const auto start_index = index_of(*options.start);
        if (!start_index) {
            return Segments{*tree_};
        }
        begin = *start_index + 1U;
    }

    std::size_t end = nodes_.size();
    if (options.stop) {
        const auto stop_index = index_of(*options.stop);
        if (stop_index) {
            end = *stop_index;
        }
    }

    std::vector<NodeId> selected;
    for (auto index = begin; index < end; ++index) {
        const auto id = nodes_[index];
        if (options.loop_while && !options.loop_while(*tree_, id)) {
            break;
        }
        if (!options.select_if || options.select_if(*tree_, id)) {
            selected.push_back(id);
        }
    }
    return Segments{*tree_, std::move(selected)};
}

Segments Segments::select(const SegmentPredicate& select_if) const
{
    SelectOptions options{};
    options.select_if = select_if;
    return select(options);
}

Segments Segments::first(const SegmentPredicate& predicate) const
{
    for (const auto id : nodes_) {
        if (!predicate || predicate(*tree_, id)) {
            return Segments{*tree_, {id}};
        }
    }
    return Segments{*tree_};
}

Segments Segments::last(const SegmentPredicate& predicate) const
{
    for (auto it = nodes_.rbegin(); it != nodes_.rend(); ++it) {
        if (!predicate || predicate(*tree_, *it)) {
            return Segments{*tree_, {*it}};
        }
    }
    return Segments{*tree_};
}

Segments Segments::head(std::size_t count) const
{
    const auto limit = std::min(count, nodes_.size());
    return Segments{*tree_, std::vector<NodeId>(nodes_.begin(), nodes_.begin() + static_cast<std::ptrdiff_t>(limit))};
}

Segments Segments::without(NodeId id) const
{
    std::vector<NodeId> remaining;
    remaining.reserve(nodes_.size());
    std::copy_if(nodes_.begin(), nodes_.end(), std::back_inserter(remaining), [id](NodeId candidate) {
        return candidate != id;
    });
    return Segments{*tree_, std::move(remaining)};
}

bool Segments::any(const SegmentPredicate& predicate) const
{
    if (!predicate) {
        return !nodes_.empty();
    }
    return std::any_of(nodes_.begin(), nodes_.end(), [this, &predicate](NodeId id) { return predicate(*tree_, id); });
}

bool Segments::all(const SegmentPredicate& predicate) const
{
    if (!predicate) {
        return true;
    }
    return std::all_of(nodes_.begin(), nodes_.end(), [this, &predicate](NodeId id) { return predicate(*tree_, id); });
}

}  // namespace terminus::syntax
