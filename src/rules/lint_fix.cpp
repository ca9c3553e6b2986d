#include "terminus/rules/lint_fix.hpp"

#include <utility>

namespace terminus::rules {

std::string_view edit_type_name(EditType type) noexcept
{
    switch (type) {
    case EditType::CreateBefore:
        return "create_before";
    case EditType::CreateAfter:
        return "create_after";
    case EditType::Replace:
        return "replace";
    case EditType::Delete:
        return "delete";
    }
    return "unknown";
}

NewSegment NewSegment::newline()
{
    return NewSegment{SegmentKind::Newline, "\n"};
}

NewSegment NewSegment::terminator(std::string_view raw)
{
    return NewSegment{SegmentKind::StatementTerminator, std::string{raw}};
}

LintFix LintFix::create_before(NodeId anchor, std::vector<NewSegment> edits)
{
    return LintFix{EditType::CreateBefore, anchor, std::move(edits)};
}

LintFix LintFix::create_after(NodeId anchor, std::vector<NewSegment> edits)
{
    return LintFix{EditType::CreateAfter, anchor, std::move(edits)};
}

LintFix LintFix::replace(NodeId anchor, std::vector<NewSegment> edits)
{
    return LintFix{EditType::Replace, anchor, std::move(edits)};
}

LintFix LintFix::remove(NodeId anchor)
{
    return LintFix{EditType::Delete, anchor, {}};
}

bool has_conflicting_anchor(const std::vector<LintFix>& fixes)
{
    for (std::size_t index = 0; index < fixes.size(); ++index) {
        if (fixes[index].type != EditType::Delete) {
            continue;
        }
        for (std::size_t other = 0; other < fixes.size(); ++other) {
            if (other != index && fixes[other].anchor == fixes[index].anchor) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace terminus::rules
