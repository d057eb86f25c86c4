#include "sequencer.hpp"
#include <fstream>
#include <sstream>
#include "errors.hpp"
#include "logger.hpp"
#include "parse_utils.hpp"

namespace gitsight {

namespace fs = std::filesystem;

static bool is_blank(char c) { return c == ' ' || c == '\t'; }

std::optional<SequencerVerb> parse_verb(const std::string& word) {
    if (word == "p" || word == "pick")
        return SequencerVerb::Pick;
    if (word == "r" || word == "reword")
        return SequencerVerb::Reword;
    if (word == "e" || word == "edit")
        return SequencerVerb::Edit;
    if (word == "s" || word == "squash")
        return SequencerVerb::Squash;
    if (word == "f" || word == "fixup")
        return SequencerVerb::Fixup;
    if (word == "x" || word == "exec")
        return SequencerVerb::Exec;
    return std::nullopt;
}

const char* verb_name(SequencerVerb verb) {
    switch (verb) {
    case SequencerVerb::Pick:
        return "pick";
    case SequencerVerb::Reword:
        return "reword";
    case SequencerVerb::Edit:
        return "edit";
    case SequencerVerb::Squash:
        return "squash";
    case SequencerVerb::Fixup:
        return "fixup";
    case SequencerVerb::Exec:
        return "exec";
    }
    return "pick";
}

std::optional<SequencerOp> parse_sequencer_line(const std::string& raw_line) {
    std::string line = raw_line;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    if (line.empty() || line[0] == '#' || line[0] == ' ')
        return std::nullopt;

    size_t verb_end = 0;
    while (verb_end < line.size() && !is_blank(line[verb_end]))
        ++verb_end;
    std::string word = line.substr(0, verb_end);
    auto verb = parse_verb(word);
    if (!verb)
        throw Error(ErrorKind::MalformedState, "invalid rebase operation type: " + word);

    size_t pos = verb_end;
    while (pos < line.size() && is_blank(line[pos]))
        ++pos;

    SequencerOp op;
    op.verb = *verb;
    if (op.verb == SequencerVerb::Exec) {
        op.message = line.substr(pos);
        if (op.message.empty())
            throw Error(ErrorKind::MalformedState, "exec step without a command");
        return op;
    }

    size_t id_end = pos;
    while (id_end < line.size() && !is_blank(line[id_end]))
        ++id_end;
    if (id_end == pos || id_end == line.size())
        throw Error(ErrorKind::MalformedState, "expected '<verb> <id> <message>': " + line);
    std::string id = line.substr(pos, id_end - pos);
    auto target = CommitRef::from_hex(id);
    if (!target)
        throw Error(ErrorKind::MalformedState, "invalid object id in rebase step: " + id);
    op.target = *target;

    pos = id_end;
    while (pos < line.size() && is_blank(line[pos]))
        ++pos;
    op.message = line.substr(pos);
    return op;
}

std::vector<SequencerOp> parse_sequencer(const std::string& text) {
    if (!is_valid_utf8(text))
        throw Error(ErrorKind::MalformedState, "sequencer file is not valid UTF-8");
    std::vector<SequencerOp> ops;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (auto op = parse_sequencer_line(line))
            ops.push_back(std::move(*op));
    }
    return ops;
}

std::vector<SequencerOp> read_sequencer(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        throw Error(ErrorKind::NotFound, "cannot open " + path.string());
    std::ostringstream buf;
    buf << ifs.rdbuf();
    auto ops = parse_sequencer(buf.str());
    log_debug("sequencer parsed", {{"path", path.string()}, {"ops", std::to_string(ops.size())}});
    return ops;
}

fs::path sequencer_todo_path(const Repository& repo) {
    return repo.gitdir() / "rebase-merge" / "git-rebase-todo";
}

std::optional<std::vector<SequencerOp>> read_pending_operations(const Repository& repo) {
    fs::path todo = sequencer_todo_path(repo);
    std::error_code ec;
    if (!fs::exists(todo, ec))
        return std::nullopt;
    return read_sequencer(todo);
}

RepoState repository_state(const Repository& repo) {
    int st = git_repository_state(repo.raw());
    switch (st) {
    case GIT_REPOSITORY_STATE_MERGE:
        return RepoState::Merge;
    case GIT_REPOSITORY_STATE_REVERT:
    case GIT_REPOSITORY_STATE_REVERT_SEQUENCE:
        return RepoState::Revert;
    case GIT_REPOSITORY_STATE_CHERRYPICK:
    case GIT_REPOSITORY_STATE_CHERRYPICK_SEQUENCE:
        return RepoState::CherryPick;
    case GIT_REPOSITORY_STATE_BISECT:
        return RepoState::Bisect;
    case GIT_REPOSITORY_STATE_REBASE:
        return RepoState::Rebase;
    case GIT_REPOSITORY_STATE_REBASE_INTERACTIVE:
        return RepoState::RebaseInteractive;
    case GIT_REPOSITORY_STATE_REBASE_MERGE:
        return RepoState::RebaseMerge;
    case GIT_REPOSITORY_STATE_APPLY_MAILBOX:
    case GIT_REPOSITORY_STATE_APPLY_MAILBOX_OR_REBASE:
        return RepoState::ApplyMailbox;
    default:
        return RepoState::None;
    }
}

const char* repo_state_name(RepoState state) {
    switch (state) {
    case RepoState::None:
        return "none";
    case RepoState::Merge:
        return "merge";
    case RepoState::Revert:
        return "revert";
    case RepoState::CherryPick:
        return "cherry-pick";
    case RepoState::Bisect:
        return "bisect";
    case RepoState::Rebase:
        return "rebase";
    case RepoState::RebaseInteractive:
        return "rebase-interactive";
    case RepoState::RebaseMerge:
        return "rebase-merge";
    case RepoState::ApplyMailbox:
        return "am";
    }
    return "none";
}

} // namespace gitsight
