#include "terminus/lint/fix_applier.hpp"

#include "terminus/lint/lint_errors.hpp"

#include <unordered_map>

namespace terminus::lint {

using rules::EditType;
using rules::LintFix;
using rules::NewSegment;
using syntax::NodeId;
using syntax::SyntaxTree;

namespace {

struct NodeEdits final {
    std::vector<const LintFix*> before{};
    std::vector<const LintFix*> after{};
    const LintFix* exclusive = nullptr;
    std::size_t count = 0U;
};

bool collect_edits(const SyntaxTree& tree,
                   const std::vector<LintFix>& fixes,
                   std::unordered_map<NodeId, NodeEdits>& edits)
{
    for (const auto& fix : fixes) {
        if (!tree.contains(fix.anchor)) {
            return false;
        }
        auto& entry = edits[fix.anchor];
        ++entry.count;
        switch (fix.type) {
        case EditType::CreateBefore:
            entry.before.push_back(&fix);
            break;
        case EditType::CreateAfter:
            entry.after.push_back(&fix);
            break;
        case EditType::Replace:
        case EditType::Delete:
            if (entry.exclusive != nullptr) {
                return false;
            }
            entry.exclusive = &fix;
            break;
        }
    }

    for (const auto& [id, entry] : edits) {
        if (entry.exclusive != nullptr && entry.count > 1U) {
            return false;
        }
    }
    return true;
}

void append_segments(const std::vector<const LintFix*>& fixes, std::string& out)
{
    for (const auto* fix : fixes) {
        for (const auto& segment : fix->edits) {
            out.append(segment.raw);
        }
    }
}

void render_node(const SyntaxTree& tree,
                 NodeId id,
                 const std::unordered_map<NodeId, NodeEdits>& edits,
                 std::string& out)
{
    const auto it = edits.find(id);
    const NodeEdits* entry = it == edits.end() ? nullptr : &it->second;

    if (entry != nullptr) {
        append_segments(entry->before, out);
        if (entry->exclusive != nullptr) {
            for (const auto& segment : entry->exclusive->edits) {
                out.append(segment.raw);
            }
            append_segments(entry->after, out);
            return;
        }
    }

    if (tree.is_raw(id)) {
        out.append(tree.node(id).raw);
    } else {
        for (const auto child : tree.children(id)) {
            render_node(tree, child, edits, out);
        }
    }

    if (entry != nullptr) {
        append_segments(entry->after, out);
    }
}

}  // namespace

bool fixes_conflict(const SyntaxTree& tree, const std::vector<LintFix>& fixes)
{
    std::unordered_map<NodeId, NodeEdits> edits;
    return !collect_edits(tree, fixes, edits);
}

FixApplication apply_fixes(const SyntaxTree& tree, const std::vector<LintFix>& fixes)
{
    FixApplication application{};
    std::unordered_map<NodeId, NodeEdits> edits;
    if (!collect_edits(tree, fixes, edits)) {
        application.source = tree.render();
        application.error = make_error_code(LintErrc::FixConflict);
        return application;
    }

    render_node(tree, tree.root(), edits, application.source);
    application.applied = fixes.size();
    return application;
}

}  // namespace terminus::lint
