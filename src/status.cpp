#include "status.hpp"
#include <algorithm>
#include "errors.hpp"
#include "logger.hpp"
#include "parse_utils.hpp"

namespace gitsight {

namespace {

struct Candidate {
    unsigned int flag;
    Change change;
};

// Strongest classification first.
const Candidate kIndexOrder[] = {{GIT_STATUS_INDEX_RENAMED, Change::Renamed},
                                 {GIT_STATUS_INDEX_MODIFIED, Change::Modified},
                                 {GIT_STATUS_INDEX_NEW, Change::New},
                                 {GIT_STATUS_INDEX_DELETED, Change::Deleted},
                                 {GIT_STATUS_INDEX_TYPECHANGE, Change::TypeChanged}};

const Candidate kWorkTreeOrder[] = {{GIT_STATUS_WT_RENAMED, Change::Renamed},
                                    {GIT_STATUS_WT_MODIFIED, Change::Modified},
                                    {GIT_STATUS_WT_NEW, Change::New},
                                    {GIT_STATUS_WT_DELETED, Change::Deleted},
                                    {GIT_STATUS_WT_TYPECHANGE, Change::TypeChanged},
                                    {GIT_STATUS_IGNORED, Change::Ignored},
                                    {GIT_STATUS_WT_UNREADABLE, Change::Unknown},
                                    {GIT_STATUS_CONFLICTED, Change::Unknown}};

template <size_t N>
std::optional<Change> pick(unsigned int bits, const Candidate (&order)[N]) {
    for (const auto& c : order) {
        if (bits & c.flag)
            return c.change;
    }
    return std::nullopt;
}

std::string checked_path(const char* path) {
    std::string p = path ? path : "";
    if (!is_valid_utf8(p))
        throw Error(ErrorKind::MalformedState, "path is not valid UTF-8: " + p);
    return p;
}

StatusEntry make_entry(const git_diff_delta* delta, Location loc, Change change) {
    StatusEntry e;
    e.location = loc;
    e.change = change;
    if (!delta)
        return e;
    const char* new_path = delta->new_file.path ? delta->new_file.path : delta->old_file.path;
    e.path = checked_path(new_path);
    if (change == Change::Renamed && delta->old_file.path)
        e.old_path = checked_path(delta->old_file.path);
    return e;
}

} // namespace

std::vector<StatusEntry> classify(const Repository& repo, const StatusOptions& opts) {
    git_status_options so = GIT_STATUS_OPTIONS_INIT;
    so.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    so.flags = GIT_STATUS_OPT_SORT_CASE_SENSITIVELY;
    if (opts.include_untracked)
        so.flags |= GIT_STATUS_OPT_INCLUDE_UNTRACKED;
    if (opts.include_untracked && opts.recurse_untracked_dirs)
        so.flags |= GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS;
    if (opts.include_ignored)
        so.flags |= GIT_STATUS_OPT_INCLUDE_IGNORED;
    if (opts.exclude_submodules)
        so.flags |= GIT_STATUS_OPT_EXCLUDE_SUBMODULES;
    if (opts.detect_renames)
        so.flags |= GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX | GIT_STATUS_OPT_RENAMES_INDEX_TO_WORKDIR;
    so.rename_threshold = opts.rename_threshold;
    git::StrArray pathspec(opts.pathspec);
    if (!opts.pathspec.empty())
        so.pathspec = *pathspec.get();

    git_status_list* raw = nullptr;
    git::check(git_status_list_new(&raw, repo.raw(), &so), "read status");
    git::status_list_ptr list(raw);

    std::vector<StatusEntry> out;
    size_t count = git_status_list_entrycount(list.get());
    for (size_t i = 0; i < count; ++i) {
        const git_status_entry* s = git_status_byindex(list.get(), i);
        if (!s || s->status == GIT_STATUS_CURRENT)
            continue;
        unsigned int bits = static_cast<unsigned int>(s->status);
        if (auto change = pick(bits, kIndexOrder))
            out.push_back(make_entry(s->head_to_index, Location::Index, *change));
        if (auto change = pick(bits, kWorkTreeOrder)) {
            const git_diff_delta* delta = s->index_to_workdir ? s->index_to_workdir
                                                              : s->head_to_index;
            out.push_back(make_entry(delta, Location::WorkingTree, *change));
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const StatusEntry& a, const StatusEntry& b) {
        if (a.location != b.location)
            return a.location == Location::Index;
        return a.path < b.path;
    });
    log_debug("status classified", {{"entries", std::to_string(out.size())}});
    return out;
}

bool is_clean(const Repository& repo, const StatusOptions& opts) {
    return classify(repo, opts).empty();
}

const char* change_name(Change change) {
    switch (change) {
    case Change::New:
        return "new";
    case Change::Modified:
        return "modified";
    case Change::Renamed:
        return "renamed";
    case Change::Deleted:
        return "deleted";
    case Change::TypeChanged:
        return "typechange";
    case Change::Ignored:
        return "ignored";
    case Change::Unknown:
        break;
    }
    return "unknown";
}

const char* location_name(Location location) {
    return location == Location::Index ? "index" : "worktree";
}

} // namespace gitsight
