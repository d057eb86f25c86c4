#include "render.hpp"
#include <sstream>
#include "time_utils.hpp"

namespace gitsight {

Palette make_palette(bool no_colors, const std::string& custom_color, const Theme& theme) {
    auto choose = [&](const std::string& def) {
        return no_colors ? std::string() : (custom_color.empty() ? def : custom_color);
    };
    return {no_colors ? std::string() : theme.reset,
            choose(theme.green),
            choose(theme.yellow),
            choose(theme.red),
            choose(theme.cyan),
            choose(theme.blue),
            choose(theme.gray),
            no_colors ? std::string() : theme.bold,
            choose(theme.magenta)};
}

bool Node::is_empty() const {
    if (std::holds_alternative<EmptyNode>(value))
        return true;
    if (const auto* b = std::get_if<BlockNode>(&value))
        return b->children.empty();
    if (const auto* m = std::get_if<MultiLineNode>(&value))
        return m->children.empty();
    return false;
}

namespace ui {

static NodePtr boxed(Node n) { return std::make_shared<const Node>(std::move(n)); }

static std::vector<Node> without_empty(std::vector<Node> children) {
    std::vector<Node> out;
    out.reserve(children.size());
    for (auto& c : children) {
        if (!c.is_empty())
            out.push_back(std::move(c));
    }
    return out;
}

Node empty() { return EmptyNode{}; }

Node spacer() { return TextNode{" "}; }

Node text(std::string text) { return TextNode{std::move(text)}; }

Node text_head_1(const std::string& text) { return TextNode{text.substr(0, text.find('\n'))}; }

Node text_capped(const std::string& text, std::size_t cap) {
    if (cap > 3 && text.size() > cap) {
        // Back off to a UTF-8 lead byte so a code point is never split.
        std::size_t cut = cap - 3;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
            --cut;
        return TextNode{text.substr(0, cut) + "..."};
    }
    return TextNode{text};
}

Node icon(Icon icon) { return IconNode{icon}; }

Node indicator(Indicator indicator) { return IndicatorNode{indicator}; }

Node attribute(AttributeKind kind, std::string value) {
    return AttributeNode{kind, std::move(value)};
}

Node dimmed(Node child) { return DimmedNode{boxed(std::move(child))}; }

Node styled(Tone tone, Node child) { return StyledNode{tone, boxed(std::move(child))}; }

Node label(Node child) { return LabelNode{boxed(std::move(child))}; }

Node block(std::vector<Node> children) { return BlockNode{without_empty(std::move(children))}; }

Node multi_line(std::vector<Node> children) {
    return MultiLineNode{without_empty(std::move(children))};
}

Node group(std::string heading, std::optional<std::size_t> count, Node child) {
    return GroupNode{std::move(heading), count, boxed(std::move(child))};
}

Node column(Node left, Node right) {
    return ColumnNode{boxed(std::move(left)), boxed(std::move(right))};
}

Node continued(Node child) { return ContinuedNode{boxed(std::move(child))}; }

} // namespace ui

namespace {

struct Renderer {
    const Palette& c;
    std::ostringstream& out;

    void paint(const std::string& color, const Node& n) {
        out << color;
        emit(n);
        out << c.reset;
    }

    void emit(const Node& n) { std::visit(*this, n.value); }

    void operator()(const EmptyNode&) {}
    void operator()(const TextNode& n) { out << n.text; }
    void operator()(const IconNode& n) {
        switch (n.icon) {
        case Icon::ArrowUp:
            out << "↑";
            break;
        case Icon::ArrowDown:
            out << "↓";
            break;
        case Icon::Lock:
            out << "⚿";
            break;
        }
    }
    void operator()(const IndicatorNode& n) {
        switch (n.indicator) {
        case Indicator::Unknown:
            out << c.gray << "⚠" << c.reset;
            break;
        case Indicator::New:
            out << c.green << "✚" << c.reset;
            break;
        case Indicator::Modified:
            out << c.yellow << "~" << c.reset;
            break;
        case Indicator::Renamed:
            out << c.yellow << "➜" << c.reset;
            break;
        case Indicator::Deleted:
            out << c.red << "✖" << c.reset;
            break;
        case Indicator::Ignored:
            out << c.gray << "!" << c.reset;
            break;
        }
    }
    void operator()(const AttributeNode& n) {
        switch (n.kind) {
        case AttributeKind::Commit:
            out << c.yellow << n.value << c.reset;
            break;
        case AttributeKind::CommitShort:
            out << c.yellow << n.value.substr(0, 7) << c.reset;
            break;
        case AttributeKind::Branch:
            out << c.blue << n.value << c.reset;
            break;
        case AttributeKind::Remote:
            out << c.cyan << "⬡ " << n.value << c.reset;
            break;
        case AttributeKind::Operation:
            out << c.magenta << n.value << c.reset;
            break;
        }
    }
    void operator()(const DimmedNode& n) { paint(c.gray, *n.child); }
    void operator()(const StyledNode& n) {
        switch (n.tone) {
        case Tone::Error:
            paint(c.red, *n.child);
            break;
        case Tone::Warning:
            paint(c.yellow, *n.child);
            break;
        case Tone::Success:
            paint(c.green, *n.child);
            break;
        case Tone::Accent:
            paint(c.cyan, *n.child);
            break;
        case Tone::Strong:
            paint(c.bold, *n.child);
            break;
        }
    }
    void operator()(const LabelNode& n) {
        out << c.gray << "(" << c.reset;
        emit(*n.child);
        out << c.gray << ")" << c.reset;
    }
    void operator()(const BlockNode& n) {
        for (const auto& child : n.children)
            emit(child);
    }
    void operator()(const MultiLineNode& n) {
        for (std::size_t i = 0; i < n.children.size(); ++i) {
            if (i > 0)
                out << '\n';
            emit(n.children[i]);
        }
    }
    void operator()(const GroupNode& n) {
        out << '\n' << c.bold << c.yellow << n.heading << c.reset;
        if (n.count)
            out << ' ' << c.gray << "(" << *n.count << ")" << c.reset;
        out << '\n';
        emit(*n.child);
    }
    void operator()(const ColumnNode& n) {
        emit(*n.left);
        out << ": ";
        emit(*n.right);
    }
    void operator()(const ContinuedNode& n) {
        out << "↪ ";
        emit(*n.child);
    }
};

} // namespace

std::string render(const Node& node, const Palette& palette) {
    std::ostringstream out;
    Renderer r{palette, out};
    r.emit(node);
    return out.str();
}

Indicator indicator_for(Change change) {
    switch (change) {
    case Change::New:
        return Indicator::New;
    case Change::Modified:
    case Change::TypeChanged:
        return Indicator::Modified;
    case Change::Renamed:
        return Indicator::Renamed;
    case Change::Deleted:
        return Indicator::Deleted;
    case Change::Ignored:
        return Indicator::Ignored;
    case Change::Unknown:
        return Indicator::Unknown;
    }
    return Indicator::Unknown;
}

std::optional<Node> remote_state_indicators(std::size_t ahead, std::size_t behind) {
    using namespace ui;
    if (ahead == 0 && behind == 0)
        return std::nullopt;
    std::vector<Node> parts;
    if (ahead > 0) {
        parts.push_back(styled(Tone::Success, icon(Icon::ArrowUp)));
        parts.push_back(spacer());
        parts.push_back(text(std::to_string(ahead)));
    }
    if (behind > 0) {
        if (!parts.empty())
            parts.push_back(spacer());
        parts.push_back(styled(Tone::Error, icon(Icon::ArrowDown)));
        parts.push_back(spacer());
        parts.push_back(text(std::to_string(behind)));
    }
    return block(std::move(parts));
}

Node branch_node(const StatusReport& report) {
    using namespace ui;
    switch (report.head.kind) {
    case HeadKind::Unborn:
        return attribute(AttributeKind::Branch, "[no branch]");
    case HeadKind::Detached:
        return block({attribute(AttributeKind::Branch, "[detached]"), spacer(),
                      report.head.target
                          ? attribute(AttributeKind::CommitShort, report.head.target->hex())
                          : empty()});
    case HeadKind::Branch:
        break;
    }
    std::vector<Node> parts{attribute(AttributeKind::Branch, report.head.shorthand), spacer()};
    if (report.upstream) {
        const auto& d = report.upstream->divergence;
        if (auto ind = remote_state_indicators(d.ahead.size(), d.behind.size())) {
            parts.push_back(label(std::move(*ind)));
            parts.push_back(spacer());
        }
    }
    if (report.head_commit)
        parts.push_back(text_capped(report.head_commit->summary, 75));
    return block(std::move(parts));
}

static Node rebase_node(const std::vector<SequencerOp>& ops) {
    using namespace ui;
    std::vector<Node> lines;
    for (const auto& op : ops) {
        std::vector<Node> parts{spacer(), spacer(),
                                attribute(AttributeKind::Operation, verb_name(op.verb)), spacer()};
        if (op.verb != SequencerVerb::Exec) {
            parts.push_back(dimmed(text(op.target.short_hex(6))));
            parts.push_back(spacer());
        }
        parts.push_back(text_head_1(op.message));
        lines.push_back(block(std::move(parts)));
    }
    lines.push_back(block({spacer(), spacer(),
                           continued(text("Fix conflicts and run 'git rebase --continue'"))}));
    return group("Rebase", ops.size(), multi_line(std::move(lines)));
}

Node state_node(const StatusReport& report) {
    using namespace ui;
    switch (report.state) {
    case RepoState::None:
        return empty();
    case RepoState::Merge:
        return text("Merge in progress");
    case RepoState::Revert:
        return text("Revert in progress");
    case RepoState::CherryPick:
        return text("Cherry-pick in progress");
    case RepoState::Bisect:
        return text("Bisect in progress");
    case RepoState::ApplyMailbox:
        return text("Apply mailbox in progress");
    case RepoState::Rebase:
    case RepoState::RebaseInteractive:
    case RepoState::RebaseMerge:
        break;
    }
    if (report.pending)
        return rebase_node(*report.pending);
    return text("Rebase in progress");
}

Node changes_node(const std::vector<StatusEntry>& changes) {
    using namespace ui;
    std::vector<Node> staged;
    std::vector<Node> unstaged;
    for (const auto& e : changes) {
        std::string where = e.old_path ? *e.old_path + " -> " + e.path : e.path;
        Node line = block({spacer(), spacer(), indicator(indicator_for(e.change)), spacer(),
                           text(where)});
        (e.location == Location::Index ? staged : unstaged).push_back(std::move(line));
    }
    std::vector<Node> groups;
    if (!staged.empty()) {
        std::size_t n = staged.size();
        groups.push_back(group("Staged Changes", n, multi_line(std::move(staged))));
    }
    if (!unstaged.empty()) {
        std::size_t n = unstaged.size();
        groups.push_back(group("Unstaged Changes", n, multi_line(std::move(unstaged))));
    }
    return multi_line(std::move(groups));
}

static Node commit_line(const CommitMeta& commit) {
    using namespace ui;
    return block({commit.is_signed() ? styled(Tone::Success, icon(Icon::Lock)) : spacer(),
                  spacer(), dimmed(text(commit.id.short_hex(6))), spacer(),
                  text_head_1(commit.summary)});
}

Node commits_node(const StatusReport& report) {
    using namespace ui;
    std::vector<Node> groups;
    const std::pair<const char*, const std::vector<CommitMeta>*> sides[] = {
        {"Unmerged into remote", &report.unmerged},
        {"Unpulled from remote", &report.unpulled},
    };
    for (const auto& [name, commits] : sides) {
        if (commits->empty())
            continue;
        std::vector<Node> lines;
        for (const auto& c : *commits)
            lines.push_back(commit_line(c));
        groups.push_back(group(name, commits->size(), multi_line(std::move(lines))));
    }
    return multi_line(std::move(groups));
}

Node status_document(const StatusReport& report) {
    using namespace ui;
    return multi_line({branch_node(report), state_node(report), changes_node(report.changes),
                       commits_node(report)});
}

Node commit_list_document(const std::vector<CommitMeta>& commits, bool short_form) {
    using namespace ui;
    std::vector<Node> lines;
    for (const auto& c : commits) {
        Node marker = c.is_signed() ? styled(Tone::Success, block({icon(Icon::Lock), spacer()}))
                                    : (short_form ? text("  ") : empty());
        lines.push_back(block({marker, attribute(AttributeKind::CommitShort, c.id.hex()), spacer(),
                               text(c.summary)}));
        if (!short_form) {
            std::string author = c.author_name.empty() ? "<unknown>" : c.author_name;
            if (!c.author_email.empty())
                author += " <" + c.author_email + ">";
            lines.push_back(
                dimmed(column(text("Date"), text(format_commit_time(c.time, c.offset_minutes)))));
            lines.push_back(dimmed(column(text("Author"), text(author))));
            lines.push_back(text(""));
        }
    }
    return MultiLineNode{std::move(lines)};
}

static Node delta_indicator(DeltaStatus status) {
    using namespace ui;
    switch (status) {
    case DeltaStatus::Added:
    case DeltaStatus::Untracked:
    case DeltaStatus::Copied:
        return indicator(Indicator::New);
    case DeltaStatus::Deleted:
        return indicator(Indicator::Deleted);
    case DeltaStatus::Renamed:
        return indicator(Indicator::Renamed);
    case DeltaStatus::Modified:
    case DeltaStatus::TypeChanged:
        return indicator(Indicator::Modified);
    case DeltaStatus::Other:
        break;
    }
    return indicator(Indicator::Unknown);
}

Node diff_stats_document(const DiffStats& stats) {
    using namespace ui;
    std::vector<Node> lines;
    for (const auto& f : stats.files) {
        std::string name =
            f.old_path != f.new_path && !f.old_path.empty() ? f.old_path + " -> " + f.new_path
                                                            : f.new_path;
        std::vector<Node> parts{spacer(), delta_indicator(f.status), spacer(), text(name),
                                dimmed(text(" | "))};
        if (f.binary) {
            parts.push_back(dimmed(text("binary")));
        } else {
            parts.push_back(styled(Tone::Success, text("+" + std::to_string(f.insertions))));
            parts.push_back(spacer());
            parts.push_back(styled(Tone::Error, text("-" + std::to_string(f.deletions))));
        }
        lines.push_back(block(std::move(parts)));
    }
    std::ostringstream summary;
    summary << " " << stats.files.size() << (stats.files.size() == 1 ? " file" : " files")
            << " changed, " << stats.insertions << " insertion"
            << (stats.insertions == 1 ? "" : "s") << "(+), " << stats.deletions << " deletion"
            << (stats.deletions == 1 ? "" : "s") << "(-)";
    lines.push_back(text(summary.str()));
    return multi_line(std::move(lines));
}

Node patch_line_node(const PatchLine& line) {
    using namespace ui;
    switch (line.origin) {
    case LineOrigin::FileHeader:
        return styled(Tone::Strong, text(line.content));
    case LineOrigin::HunkHeader:
        return styled(Tone::Accent, text(line.content));
    case LineOrigin::Addition:
        return styled(Tone::Success, text("+" + line.content));
    case LineOrigin::Deletion:
        return styled(Tone::Error, text("-" + line.content));
    case LineOrigin::Context:
        break;
    }
    return text(" " + line.content);
}

} // namespace gitsight
