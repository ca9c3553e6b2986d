#pragma once

#include "terminus/syntax/syntax_tree.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace terminus::rules {

using syntax::NodeId;
using syntax::SegmentKind;

enum class EditType : std::uint8_t {
    CreateBefore = 0,
    CreateAfter,
    Replace,
    Delete
};

[[nodiscard]] std::string_view edit_type_name(EditType type) noexcept;

// Segment created by a fix. It has no position until the fix is applied.
struct NewSegment final {
    SegmentKind kind = SegmentKind::Other;
    std::string raw{};

    [[nodiscard]] static NewSegment newline();
    [[nodiscard]] static NewSegment terminator(std::string_view raw = ";");

    friend bool operator==(const NewSegment&, const NewSegment&) = default;
};

struct LintFix final {
    EditType type = EditType::Delete;
    NodeId anchor = syntax::kInvalidNode;
    std::vector<NewSegment> edits{};

    [[nodiscard]] static LintFix create_before(NodeId anchor, std::vector<NewSegment> edits);
    [[nodiscard]] static LintFix create_after(NodeId anchor, std::vector<NewSegment> edits);
    [[nodiscard]] static LintFix replace(NodeId anchor, std::vector<NewSegment> edits);
    [[nodiscard]] static LintFix remove(NodeId anchor);

    friend bool operator==(const LintFix&, const LintFix&) = default;
};

struct LintResult final {
    NodeId anchor = syntax::kInvalidNode;
    std::string description{};
    std::vector<LintFix> fixes{};
};

// True when a Delete shares its anchor with any other fix in the set.
[[nodiscard]] bool has_conflicting_anchor(const std::vector<LintFix>& fixes);

}  // namespace terminus::rules
