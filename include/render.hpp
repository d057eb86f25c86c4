#ifndef RENDER_HPP
#define RENDER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "diff.hpp"
#include "report.hpp"

namespace gitsight {

/**
 * @brief Theme definition for terminal output.
 *
 * Contains raw ANSI sequences for each color used by the renderer. A theme
 * file may override any field by name.
 */
struct Theme {
    std::string reset = "\033[0m";
    std::string green = "\033[32m";
    std::string yellow = "\033[33m";
    std::string red = "\033[31m";
    std::string cyan = "\033[36m";
    std::string blue = "\033[34m";
    std::string gray = "\033[90m";
    std::string bold = "\033[1m";
    std::string magenta = "\033[35m";
};

/**
 * @brief Resolved color codes; every field is empty when colors are off.
 */
struct Palette {
    std::string reset;
    std::string green;
    std::string yellow;
    std::string red;
    std::string cyan;
    std::string blue;
    std::string gray;
    std::string bold;
    std::string magenta;
};

/**
 * @brief Create a color palette honoring user preferences.
 *
 * @param no_colors    Disable every escape sequence.
 * @param custom_color Single ANSI sequence replacing every color when set.
 * @param theme        Base theme.
 */
Palette make_palette(bool no_colors, const std::string& custom_color, const Theme& theme);

enum class Icon { ArrowUp, ArrowDown, Lock };

enum class Indicator { Unknown, New, Modified, Renamed, Deleted, Ignored };

enum class Tone { Error, Warning, Success, Accent, Strong };

enum class AttributeKind { Commit, CommitShort, Branch, Remote, Operation };

struct Node;
using NodePtr = std::shared_ptr<const Node>;

struct EmptyNode {};
struct TextNode {
    std::string text;
};
struct IconNode {
    Icon icon;
};
struct IndicatorNode {
    Indicator indicator;
};
struct AttributeNode {
    AttributeKind kind;
    std::string value;
};
struct DimmedNode {
    NodePtr child;
};
struct StyledNode {
    Tone tone;
    NodePtr child;
};
/// Child wrapped in dimmed parentheses.
struct LabelNode {
    NodePtr child;
};
/// Children concatenated on one line.
struct BlockNode {
    std::vector<Node> children;
};
/// Children separated by newlines.
struct MultiLineNode {
    std::vector<Node> children;
};
/// Heading with an optional item count above its body.
struct GroupNode {
    std::string heading;
    std::optional<std::size_t> count;
    NodePtr child;
};
/// `left: right`
struct ColumnNode {
    NodePtr left;
    NodePtr right;
};
/// Follow-up hint prefixed with an arrow.
struct ContinuedNode {
    NodePtr child;
};

/**
 * @brief Document tree consumed by @ref render.
 */
struct Node {
    using Variant =
        std::variant<EmptyNode, TextNode, IconNode, IndicatorNode, AttributeNode, DimmedNode,
                     StyledNode, LabelNode, BlockNode, MultiLineNode, GroupNode, ColumnNode,
                     ContinuedNode>;

    Node() = default;
    Node(EmptyNode v) : value(std::move(v)) {}
    Node(TextNode v) : value(std::move(v)) {}
    Node(IconNode v) : value(std::move(v)) {}
    Node(IndicatorNode v) : value(std::move(v)) {}
    Node(AttributeNode v) : value(std::move(v)) {}
    Node(DimmedNode v) : value(std::move(v)) {}
    Node(StyledNode v) : value(std::move(v)) {}
    Node(LabelNode v) : value(std::move(v)) {}
    Node(BlockNode v) : value(std::move(v)) {}
    Node(MultiLineNode v) : value(std::move(v)) {}
    Node(GroupNode v) : value(std::move(v)) {}
    Node(ColumnNode v) : value(std::move(v)) {}
    Node(ContinuedNode v) : value(std::move(v)) {}

    /** @return `true` for Empty and for Block/MultiLine without children. */
    bool is_empty() const;

    Variant value;
};

namespace ui {

Node empty();
Node spacer();
Node text(std::string text);
/// First line of @p text only.
Node text_head_1(const std::string& text);
/// @p text shortened to @p cap characters with a trailing `...`.
Node text_capped(const std::string& text, std::size_t cap);
Node icon(Icon icon);
Node indicator(Indicator indicator);
Node attribute(AttributeKind kind, std::string value);
Node dimmed(Node child);
Node styled(Tone tone, Node child);
Node label(Node child);
/// Empty children are dropped.
Node block(std::vector<Node> children);
/// Empty children are dropped.
Node multi_line(std::vector<Node> children);
Node group(std::string heading, std::optional<std::size_t> count, Node child);
Node column(Node left, Node right);
Node continued(Node child);

} // namespace ui

/**
 * @brief Render @p node to a string using @p palette.
 */
std::string render(const Node& node, const Palette& palette);

Indicator indicator_for(Change change);

/** @brief Branch line: name, ahead/behind indicators and HEAD summary. */
Node branch_node(const StatusReport& report);

/**
 * @brief Ahead/behind arrows, or `std::nullopt` when in sync.
 */
std::optional<Node> remote_state_indicators(std::size_t ahead, std::size_t behind);

/** @brief In-progress operation; the remaining rebase steps when known. */
Node state_node(const StatusReport& report);

/** @brief "Staged Changes" and "Unstaged Changes" groups. */
Node changes_node(const std::vector<StatusEntry>& changes);

/** @brief "Unmerged into remote" and "Unpulled from remote" groups. */
Node commits_node(const StatusReport& report);

Node status_document(const StatusReport& report);

/**
 * @brief Commit log: signed marker, short id and message, followed by date
 *        and author unless @p short_form is set.
 */
Node commit_list_document(const std::vector<CommitMeta>& commits, bool short_form);

Node diff_stats_document(const DiffStats& stats);

Node patch_line_node(const PatchLine& line);

} // namespace gitsight

#endif // RENDER_HPP
