#include "terminus/syntax/syntax_tree.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace terminus::syntax {

bool is_composite_kind(SegmentKind kind) noexcept
{
    switch (kind) {
    case SegmentKind::File:
    case SegmentKind::Statement:
    case SegmentKind::Bracketed:
        return true;
    default:
        return false;
    }
}

bool is_meta_kind(SegmentKind kind) noexcept
{
    switch (kind) {
    case SegmentKind::Indent:
    case SegmentKind::Dedent:
    case SegmentKind::EndOfFile:
        return true;
    default:
        return false;
    }
}

bool is_comment_kind(SegmentKind kind) noexcept
{
    return kind == SegmentKind::InlineComment || kind == SegmentKind::BlockComment;
}

bool is_whitespace_kind(SegmentKind kind) noexcept
{
    return kind == SegmentKind::Whitespace || kind == SegmentKind::Newline;
}

std::string_view segment_kind_name(SegmentKind kind) noexcept
{
    switch (kind) {
    case SegmentKind::File:
        return "file";
    case SegmentKind::Statement:
        return "statement";
    case SegmentKind::Bracketed:
        return "bracketed";
    case SegmentKind::StatementTerminator:
        return "statement_terminator";
    case SegmentKind::Keyword:
        return "keyword";
    case SegmentKind::Identifier:
        return "identifier";
    case SegmentKind::Literal:
        return "literal";
    case SegmentKind::Symbol:
        return "symbol";
    case SegmentKind::Whitespace:
        return "whitespace";
    case SegmentKind::Newline:
        return "newline";
    case SegmentKind::InlineComment:
        return "inline_comment";
    case SegmentKind::BlockComment:
        return "block_comment";
    case SegmentKind::Indent:
        return "indent";
    case SegmentKind::Dedent:
        return "dedent";
    case SegmentKind::EndOfFile:
        return "end_of_file";
    case SegmentKind::Other:
    default:
        return "other";
    }
}

SyntaxTree::SyntaxTree()
{
    SyntaxNode file{};
    file.kind = SegmentKind::File;
    file.position = PositionMarker{1U, 1U, 0U};
    nodes_.push_back(std::move(file));
}

NodeId SyntaxTree::add_node(SegmentKind kind, NodeId parent)
{
    if (!is_composite_kind(kind)) {
        throw std::invalid_argument{"SyntaxTree::add_node requires a composite segment kind"};
    }
    if (!contains(parent) || !is_composite_kind(nodes_[parent].kind)) {
        throw std::invalid_argument{"SyntaxTree::add_node requires a composite parent"};
    }

    const auto id = static_cast<NodeId>(nodes_.size());
    SyntaxNode node{};
    node.kind = kind;
    node.parent = parent;
    node.sibling_index = nodes_[parent].children.size();
    nodes_.push_back(std::move(node));
    nodes_[parent].children.push_back(id);
    return id;
}

NodeId SyntaxTree::add_raw(SegmentKind kind, std::string raw, PositionMarker position, NodeId parent)
{
    if (is_composite_kind(kind)) {
        throw std::invalid_argument{"SyntaxTree::add_raw requires a leaf segment kind"};
    }
    if (!contains(parent) || !is_composite_kind(nodes_[parent].kind)) {
        throw std::invalid_argument{"SyntaxTree::add_raw requires a composite parent"};
    }

    const auto id = static_cast<NodeId>(nodes_.size());
    SyntaxNode node{};
    node.kind = kind;
    node.raw = std::move(raw);
    node.position = position;
    node.parent = parent;
    node.sibling_index = nodes_[parent].children.size();
    nodes_.push_back(std::move(node));
    nodes_[parent].children.push_back(id);
    return id;
}

NodeId SyntaxTree::add_meta(SegmentKind kind, PositionMarker position, NodeId parent)
{
    if (!is_meta_kind(kind)) {
        throw std::invalid_argument{"SyntaxTree::add_meta requires a meta segment kind"};
    }
    return add_raw(kind, std::string{}, position, parent);
}

const SyntaxNode& SyntaxTree::node(NodeId id) const
{
    return nodes_.at(id);
}

SegmentKind SyntaxTree::kind(NodeId id) const
{
    return node(id).kind;
}

NodeId SyntaxTree::parent(NodeId id) const
{
    return node(id).parent;
}

std::span<const NodeId> SyntaxTree::children(NodeId id) const
{
    const auto& entry = node(id);
    return {entry.children.data(), entry.children.size()};
}

std::optional<std::size_t> SyntaxTree::index_in_parent(NodeId id) const
{
    const auto& entry = node(id);
    if (entry.parent == kInvalidNode) {
        return std::nullopt;
    }
    return entry.sibling_index;
}

bool SyntaxTree::is_raw(NodeId id) const
{
    return !is_composite_kind(kind(id));
}

bool SyntaxTree::is_meta(NodeId id) const
{
    return is_meta_kind(kind(id));
}

bool SyntaxTree::is_comment(NodeId id) const
{
    return is_comment_kind(kind(id));
}

bool SyntaxTree::is_whitespace(NodeId id) const
{
    return is_whitespace_kind(kind(id));
}

bool SyntaxTree::is_code(NodeId id) const
{
    const auto& entry = node(id);
    if (!is_composite_kind(entry.kind)) {
        return !is_whitespace_kind(entry.kind) && !is_comment_kind(entry.kind) && !is_meta_kind(entry.kind);
    }
    return std::any_of(entry.children.begin(), entry.children.end(), [this](NodeId child) {
        return is_code(child);
    });
}

bool SyntaxTree::is_type(NodeId id, SegmentKind kind) const
{
    return this->kind(id) == kind;
}

bool SyntaxTree::can_start_end_non_code(NodeId id) const
{
    return kind(id) == SegmentKind::File;
}

std::string SyntaxTree::raw(NodeId id) const
{
    std::string out;
    append_raw(id, out);
    return out;
}

PositionMarker SyntaxTree::position(NodeId id) const
{
    const auto& entry = node(id);
    if (!is_composite_kind(entry.kind)) {
        return entry.position;
    }
    for (const auto child : entry.children) {
        if (is_composite_kind(nodes_[child].kind) && nodes_[child].children.empty()) {
            continue;
        }
        return position(child);
    }
    return entry.position;
}

std::vector<NodeId> SyntaxTree::raw_segments(NodeId id) const
{
    std::vector<NodeId> out;
    collect_raw_segments(id, out);
    return out;
}

NodeId SyntaxTree::first_raw(NodeId id) const
{
    const auto& entry = node(id);
    if (!is_composite_kind(entry.kind)) {
        return id;
    }
    for (const auto child : entry.children) {
        const auto leaf = first_raw(child);
        if (leaf != kInvalidNode) {
            return leaf;
        }
    }
    return kInvalidNode;
}

NodeId SyntaxTree::last_raw(NodeId id) const
{
    const auto& entry = node(id);
    if (!is_composite_kind(entry.kind)) {
        return id;
    }
    for (auto it = entry.children.rbegin(); it != entry.children.rend(); ++it) {
        const auto leaf = last_raw(*it);
        if (leaf != kInvalidNode) {
            return leaf;
        }
    }
    return kInvalidNode;
}

NodeId SyntaxTree::previous_raw(NodeId id) const
{
    auto current = id;
    while (nodes_.at(current).parent != kInvalidNode) {
        const auto& entry = nodes_[current];
        const auto& siblings = nodes_[entry.parent].children;
        for (auto index = entry.sibling_index; index > 0U; --index) {
            const auto leaf = last_raw(siblings[index - 1U]);
            if (leaf != kInvalidNode) {
                return leaf;
            }
        }
        current = entry.parent;
    }
    return kInvalidNode;
}

NodeId SyntaxTree::next_raw(NodeId id) const
{
    auto current = id;
    while (nodes_.at(current).parent != kInvalidNode) {
        const auto& entry = nodes_[current];
        const auto& siblings = nodes_[entry.parent].children;
        for (auto index = entry.sibling_index + 1U; index < siblings.size(); ++index) {
            const auto leaf = first_raw(siblings[index]);
            if (leaf != kInvalidNode) {
                return leaf;
            }
        }
        current = entry.parent;
    }
    return kInvalidNode;
}

std::vector<NodeId> SyntaxTree::path_to(NodeId ancestor, NodeId target) const
{
    if (!contains(ancestor) || !contains(target) || ancestor == target) {
        return {};
    }

    std::vector<NodeId> path;
    auto current = nodes_[target].parent;
    while (current != kInvalidNode) {
        path.push_back(current);
        if (current == ancestor) {
            std::reverse(path.begin(), path.end());
            return path;
        }
        current = nodes_[current].parent;
    }
    return {};
}

std::vector<NodeId> SyntaxTree::recursive_crawl(NodeId start, const NodePredicate& predicate) const
{
    std::vector<NodeId> matches;
    if (!contains(start) || !predicate) {
        return matches;
    }

    std::vector<NodeId> pending{start};
    while (!pending.empty()) {
        const auto current = pending.back();
        pending.pop_back();
        const auto& entry = nodes_[current];
        if (predicate(entry)) {
            matches.push_back(current);
        }
        for (auto it = entry.children.rbegin(); it != entry.children.rend(); ++it) {
            pending.push_back(*it);
        }
    }
    return matches;
}

std::vector<NodeId> SyntaxTree::recursive_crawl(NodeId start, SegmentKind kind) const
{
    return recursive_crawl(start, [kind](const SyntaxNode& entry) { return entry.kind == kind; });
}

bool SyntaxTree::contains_kind(NodeId start, SegmentKind kind) const
{
    if (!contains(start)) {
        return false;
    }
    const auto& entry = nodes_[start];
    if (entry.kind == kind) {
        return true;
    }
    return std::any_of(entry.children.begin(), entry.children.end(), [this, kind](NodeId child) {
        return contains_kind(child, kind);
    });
}

std::string SyntaxTree::render() const
{
    return raw(root());
}

void SyntaxTree::append_raw(NodeId id, std::string& out) const
{
    const auto& entry = node(id);
    if (!is_composite_kind(entry.kind)) {
        out.append(entry.raw);
        return;
    }
    for (const auto child : entry.children) {
        append_raw(child, out);
    }
}

void SyntaxTree::collect_raw_segments(NodeId id, std::vector<NodeId>& out) const
{
    const auto& entry = node(id);
    if (!is_composite_kind(entry.kind)) {
        out.push_back(id);
        return;
    }
    for (const auto child : entry.children) {
        collect_raw_segments(child, out);
    }
}

}  // namespace terminus::syntax
