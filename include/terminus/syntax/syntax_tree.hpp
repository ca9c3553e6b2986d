#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace terminus::syntax {

using NodeId = std::uint32_t;

inline constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();

enum class SegmentKind : std::uint8_t {
    File = 0,
    Statement,
    Bracketed,
    StatementTerminator,
    Keyword,
    Identifier,
    Literal,
    Symbol,
    Whitespace,
    Newline,
    InlineComment,
    BlockComment,
    Indent,
    Dedent,
    EndOfFile,
    Other
};

struct PositionMarker final {
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::size_t offset = 0U;
};

struct SyntaxNode final {
    SegmentKind kind = SegmentKind::Other;
    std::string raw{};
    PositionMarker position{};
    NodeId parent = kInvalidNode;
    std::size_t sibling_index = 0U;
    std::vector<NodeId> children{};
};

[[nodiscard]] bool is_composite_kind(SegmentKind kind) noexcept;
[[nodiscard]] bool is_meta_kind(SegmentKind kind) noexcept;
[[nodiscard]] bool is_comment_kind(SegmentKind kind) noexcept;
[[nodiscard]] bool is_whitespace_kind(SegmentKind kind) noexcept;
[[nodiscard]] std::string_view segment_kind_name(SegmentKind kind) noexcept;

class SyntaxTree final {
public:
    using NodePredicate = std::function<bool(const SyntaxNode&)>;

    SyntaxTree();

    SyntaxTree(const SyntaxTree&) = default;
    SyntaxTree& operator=(const SyntaxTree&) = default;
    SyntaxTree(SyntaxTree&&) noexcept = default;
    SyntaxTree& operator=(SyntaxTree&&) noexcept = default;

    NodeId add_node(SegmentKind kind, NodeId parent);
    NodeId add_raw(SegmentKind kind, std::string raw, PositionMarker position, NodeId parent);
    NodeId add_meta(SegmentKind kind, PositionMarker position, NodeId parent);

    [[nodiscard]] NodeId root() const noexcept { return 0U; }
    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool contains(NodeId id) const noexcept { return id < nodes_.size(); }

    [[nodiscard]] const SyntaxNode& node(NodeId id) const;
    [[nodiscard]] SegmentKind kind(NodeId id) const;
    [[nodiscard]] NodeId parent(NodeId id) const;
    [[nodiscard]] std::span<const NodeId> children(NodeId id) const;
    [[nodiscard]] std::optional<std::size_t> index_in_parent(NodeId id) const;

    [[nodiscard]] bool is_raw(NodeId id) const;
    [[nodiscard]] bool is_meta(NodeId id) const;
    [[nodiscard]] bool is_comment(NodeId id) const;
    [[nodiscard]] bool is_whitespace(NodeId id) const;
    [[nodiscard]] bool is_code(NodeId id) const;
    [[nodiscard]] bool is_type(NodeId id, SegmentKind kind) const;
    [[nodiscard]] bool can_start_end_non_code(NodeId id) const;

    [[nodiscard]] std::string raw(NodeId id) const;
    [[nodiscard]] PositionMarker position(NodeId id) const;

    [[nodiscard]] std::vector<NodeId> raw_segments(NodeId id) const;

    // Leaf cursors in source order. Each returns kInvalidNode when there is no
    // such leaf; composites without leaves are stepped over.
    [[nodiscard]] NodeId first_raw(NodeId id) const;
    [[nodiscard]] NodeId last_raw(NodeId id) const;
    [[nodiscard]] NodeId previous_raw(NodeId id) const;
    [[nodiscard]] NodeId next_raw(NodeId id) const;
    [[nodiscard]] std::vector<NodeId> path_to(NodeId ancestor, NodeId target) const;
    [[nodiscard]] std::vector<NodeId> recursive_crawl(NodeId start, const NodePredicate& predicate) const;
    [[nodiscard]] std::vector<NodeId> recursive_crawl(NodeId start, SegmentKind kind) const;
    [[nodiscard]] bool contains_kind(NodeId start, SegmentKind kind) const;

    [[nodiscard]] std::string render() const;

private:
    void append_raw(NodeId id, std::string& out) const;
    void collect_raw_segments(NodeId id, std::vector<NodeId>& out) const;

    std::vector<SyntaxNode> nodes_{};
};

}  // namespace terminus::syntax
