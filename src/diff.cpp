#include "diff.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace gitsight {

namespace {

DeltaStatus map_status(git_delta_t s) {
    switch (s) {
    case GIT_DELTA_ADDED:
        return DeltaStatus::Added;
    case GIT_DELTA_DELETED:
        return DeltaStatus::Deleted;
    case GIT_DELTA_MODIFIED:
        return DeltaStatus::Modified;
    case GIT_DELTA_RENAMED:
        return DeltaStatus::Renamed;
    case GIT_DELTA_COPIED:
        return DeltaStatus::Copied;
    case GIT_DELTA_TYPECHANGE:
        return DeltaStatus::TypeChanged;
    case GIT_DELTA_UNTRACKED:
        return DeltaStatus::Untracked;
    default:
        return DeltaStatus::Other;
    }
}

std::string path_or_empty(const char* p) { return p ? p : ""; }

std::string strip_newline(const char* text, size_t len) {
    std::string s(text, len);
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
        s.pop_back();
    return s;
}

std::string file_header(const git_diff_delta* delta) {
    std::string old_path = path_or_empty(delta->old_file.path);
    std::string new_path = path_or_empty(delta->new_file.path);
    std::string header = old_path == new_path ? new_path : old_path + " -> " + new_path;
    if (delta->flags & GIT_DIFF_FLAG_BINARY)
        header += " (binary)";
    return header;
}

git::patch_ptr load_patch(git_diff* diff, size_t idx) {
    git_patch* raw = nullptr;
    git::check(git_patch_from_diff(&raw, diff, idx), "build patch");
    return git::patch_ptr(raw);
}

git_diff_options make_options(const DiffOptions& opts, git::StrArray& pathspec) {
    git_diff_options o = GIT_DIFF_OPTIONS_INIT;
    if (opts.force_text)
        o.flags |= GIT_DIFF_FORCE_TEXT;
    switch (opts.whitespace) {
    case Whitespace::IgnoreAll:
        o.flags |= GIT_DIFF_IGNORE_WHITESPACE;
        break;
    case Whitespace::IgnoreChange:
        o.flags |= GIT_DIFF_IGNORE_WHITESPACE_CHANGE;
        break;
    case Whitespace::IgnoreEol:
        o.flags |= GIT_DIFF_IGNORE_WHITESPACE_EOL;
        break;
    case Whitespace::Exact:
        break;
    }
    if (opts.include_untracked)
        o.flags |= GIT_DIFF_INCLUDE_UNTRACKED | GIT_DIFF_RECURSE_UNTRACKED_DIRS |
                   GIT_DIFF_SHOW_UNTRACKED_CONTENT;
    o.context_lines = opts.context_lines;
    if (!opts.pathspec.empty())
        o.pathspec = *pathspec.get();
    return o;
}

Diff finish(git_diff* raw, const DiffOptions& opts) {
    git::diff_ptr diff(raw);
    if (opts.detect_renames) {
        git_diff_find_options fo = GIT_DIFF_FIND_OPTIONS_INIT;
        fo.flags = GIT_DIFF_FIND_RENAMES | GIT_DIFF_FIND_COPIES | GIT_DIFF_FIND_FOR_UNTRACKED;
        git::check(git_diff_find_similar(diff.get(), &fo), "detect renames");
    }
    return Diff(std::move(diff));
}

} // namespace

PatchStream::PatchStream(git_diff* diff)
    : diff_(diff), num_deltas_(diff ? git_diff_num_deltas(diff) : 0) {}

std::optional<PatchLine> PatchStream::next() {
    while (delta_ < num_deltas_) {
        if (!header_done_) {
            header_done_ = true;
            patch_ = load_patch(diff_, delta_);
            num_hunks_ = patch_ ? git_patch_num_hunks(patch_.get()) : 0;
            hunk_ = 0;
            in_hunk_ = false;
            PatchLine out;
            out.origin = LineOrigin::FileHeader;
            out.content = file_header(git_diff_get_delta(diff_, delta_));
            return out;
        }
        if (hunk_ < num_hunks_) {
            if (!in_hunk_) {
                const git_diff_hunk* hunk = nullptr;
                size_t lines = 0;
                git::check(git_patch_get_hunk(&hunk, &lines, patch_.get(), hunk_), "read hunk");
                num_lines_ = lines;
                line_ = 0;
                in_hunk_ = true;
                PatchLine out;
                out.origin = LineOrigin::HunkHeader;
                out.content = strip_newline(hunk->header, hunk->header_len);
                out.old_lineno = hunk->old_start;
                out.new_lineno = hunk->new_start;
                return out;
            }
            if (line_ < num_lines_) {
                const git_diff_line* l = nullptr;
                git::check(git_patch_get_line_in_hunk(&l, patch_.get(), hunk_, line_),
                           "read patch line");
                ++line_;
                PatchLine out;
                switch (l->origin) {
                case GIT_DIFF_LINE_ADDITION:
                    out.origin = LineOrigin::Addition;
                    break;
                case GIT_DIFF_LINE_DELETION:
                    out.origin = LineOrigin::Deletion;
                    break;
                default:
                    // context and the end-of-file newline markers
                    out.origin = LineOrigin::Context;
                    break;
                }
                out.content = strip_newline(l->content, l->content_len);
                out.old_lineno = l->old_lineno;
                out.new_lineno = l->new_lineno;
                return out;
            }
            ++hunk_;
            in_hunk_ = false;
            continue;
        }
        patch_.reset();
        header_done_ = false;
        ++delta_;
    }
    return std::nullopt;
}

Diff::Diff(git::diff_ptr diff) : diff_(std::move(diff)) {}

std::size_t Diff::num_files() const { return git_diff_num_deltas(diff_.get()); }

DiffStats Diff::stats() const {
    DiffStats out;
    size_t n = num_files();
    for (size_t i = 0; i < n; ++i) {
        git::patch_ptr patch = load_patch(diff_.get(), i);
        const git_diff_delta* delta = git_diff_get_delta(diff_.get(), i);
        FileDelta fd;
        fd.old_path = path_or_empty(delta->old_file.path);
        fd.new_path = path_or_empty(delta->new_file.path);
        fd.status = map_status(delta->status);
        fd.binary = (delta->flags & GIT_DIFF_FLAG_BINARY) != 0;
        if (patch) {
            size_t context = 0, adds = 0, dels = 0;
            git::check(git_patch_line_stats(&context, &adds, &dels, patch.get()), "count lines");
            fd.insertions = adds;
            fd.deletions = dels;
        }
        out.insertions += fd.insertions;
        out.deletions += fd.deletions;
        out.files.push_back(std::move(fd));
    }
    log_debug("diff stats", {{"files", std::to_string(out.files.size())},
                             {"insertions", std::to_string(out.insertions)},
                             {"deletions", std::to_string(out.deletions)}});
    return out;
}

Diff diff_commits(const Repository& repo, const CommitRef& base, const CommitRef& target,
                  const DiffOptions& opts) {
    git::tree_ptr old_tree = repo.read_tree(base);
    git::tree_ptr new_tree = repo.read_tree(target);
    git::StrArray pathspec(opts.pathspec);
    git_diff_options o = make_options(opts, pathspec);
    git_diff* raw = nullptr;
    git::check(git_diff_tree_to_tree(&raw, repo.raw(), old_tree.get(), new_tree.get(), &o),
               "diff " + base.short_hex() + ".." + target.short_hex());
    return finish(raw, opts);
}

Diff diff_head_to_workdir(const Repository& repo, const DiffOptions& opts) {
    git::tree_ptr head = repo.head_tree();
    git::StrArray pathspec(opts.pathspec);
    git_diff_options o = make_options(opts, pathspec);
    git_diff* raw = nullptr;
    git::check(git_diff_tree_to_workdir_with_index(&raw, repo.raw(), head.get(), &o),
               "diff HEAD to working tree");
    return finish(raw, opts);
}

Diff diff_staged(const Repository& repo, const DiffOptions& opts) {
    git::tree_ptr head = repo.head_tree();
    git::StrArray pathspec(opts.pathspec);
    git_diff_options o = make_options(opts, pathspec);
    git_diff* raw = nullptr;
    git::check(git_diff_tree_to_index(&raw, repo.raw(), head.get(), nullptr, &o),
               "diff HEAD to index");
    return finish(raw, opts);
}

Diff diff_unstaged(const Repository& repo, const DiffOptions& opts) {
    git::StrArray pathspec(opts.pathspec);
    git_diff_options o = make_options(opts, pathspec);
    git_diff* raw = nullptr;
    git::check(git_diff_index_to_workdir(&raw, repo.raw(), nullptr, &o),
               "diff index to working tree");
    return finish(raw, opts);
}

const char* delta_status_name(DeltaStatus status) {
    switch (status) {
    case DeltaStatus::Added:
        return "added";
    case DeltaStatus::Deleted:
        return "deleted";
    case DeltaStatus::Modified:
        return "modified";
    case DeltaStatus::Renamed:
        return "renamed";
    case DeltaStatus::Copied:
        return "copied";
    case DeltaStatus::TypeChanged:
        return "typechange";
    case DeltaStatus::Untracked:
        return "untracked";
    case DeltaStatus::Other:
        break;
    }
    return "other";
}

} // namespace gitsight
