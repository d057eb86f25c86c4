#ifndef SEQUENCER_HPP
#define SEQUENCER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "object_store.hpp"

namespace gitsight {

enum class SequencerVerb { Pick, Reword, Edit, Squash, Fixup, Exec };

/**
 * @brief One remaining step of an interactive rebase.
 *
 * `exec` steps carry the zero id as target and the shell command as message.
 */
struct SequencerOp {
    CommitRef target;
    SequencerVerb verb = SequencerVerb::Pick;
    std::string message;
};

/// Multi-step operation the repository is in the middle of.
enum class RepoState {
    None,
    Merge,
    Revert,
    CherryPick,
    Bisect,
    Rebase,
    RebaseInteractive,
    RebaseMerge,
    ApplyMailbox
};

/** @return Verb for a full name or its one-letter alias, if known. */
std::optional<SequencerVerb> parse_verb(const std::string& word);

const char* verb_name(SequencerVerb verb);

/**
 * @brief Parse one todo line.
 *
 * @return `std::nullopt` for blank lines, comments and lines that start with
 *         a space.
 * @throws Error `MalformedState` for an unknown verb, a bad object id or a
 *         missing message.
 */
std::optional<SequencerOp> parse_sequencer_line(const std::string& line);

/**
 * @brief Parse a whole todo list; a single malformed line fails the call.
 */
std::vector<SequencerOp> parse_sequencer(const std::string& text);

/**
 * @brief Read and parse the todo file at @a path, preserving file order.
 *
 * @throws Error `NotFound` when the file does not exist, `MalformedState`
 *         when it is not valid UTF-8 or contains a malformed line.
 */
std::vector<SequencerOp> read_sequencer(const std::filesystem::path& path);

/** @return `<gitdir>/rebase-merge/git-rebase-todo`. */
std::filesystem::path sequencer_todo_path(const Repository& repo);

/**
 * @brief Steps left in an interactive rebase, or `std::nullopt` when no todo
 *        file exists.
 */
std::optional<std::vector<SequencerOp>> read_pending_operations(const Repository& repo);

RepoState repository_state(const Repository& repo);

const char* repo_state_name(RepoState state);

} // namespace gitsight

#endif // SEQUENCER_HPP
