#ifndef DIFF_HPP
#define DIFF_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "object_store.hpp"

namespace gitsight {

enum class Whitespace { Exact, IgnoreAll, IgnoreChange, IgnoreEol };

struct DiffOptions {
    std::vector<std::string> pathspec;
    Whitespace whitespace = Whitespace::IgnoreAll;
    bool include_untracked = true;
    bool detect_renames = true;
    std::uint32_t context_lines = 3;
    bool force_text = true;
};

enum class DeltaStatus { Added, Deleted, Modified, Renamed, Copied, TypeChanged, Untracked, Other };

struct FileDelta {
    std::string old_path;
    std::string new_path;
    DeltaStatus status = DeltaStatus::Other;
    std::size_t insertions = 0;
    std::size_t deletions = 0;
    bool binary = false;
};

struct DiffStats {
    std::size_t insertions = 0;
    std::size_t deletions = 0;
    std::vector<FileDelta> files;
};

enum class LineOrigin : char {
    FileHeader = 'F',
    HunkHeader = 'H',
    Context = ' ',
    Addition = '+',
    Deletion = '-'
};

struct PatchLine {
    LineOrigin origin = LineOrigin::Context;
    std::string content; ///< Without the trailing newline
    int old_lineno = -1;
    int new_lineno = -1;
};

/**
 * @brief Forward-only, single-pass iterator over the lines of a diff.
 *
 * Only the patch of the file being emitted is held in memory. The stream
 * borrows the diff it came from and must not outlive it.
 */
class PatchStream {
  public:
    explicit PatchStream(git_diff* diff);

    /** @return Next line, or `std::nullopt` once every file is exhausted. */
    std::optional<PatchLine> next();

  private:
    git_diff* diff_;
    std::size_t num_deltas_ = 0;
    std::size_t delta_ = 0;
    bool header_done_ = false;
    git::patch_ptr patch_;
    std::size_t num_hunks_ = 0;
    std::size_t hunk_ = 0;
    bool in_hunk_ = false;
    std::size_t num_lines_ = 0;
    std::size_t line_ = 0;
};

/**
 * @brief Owned diff between two snapshots.
 */
class Diff {
  public:
    explicit Diff(git::diff_ptr diff);

    std::size_t num_files() const;

    /** @brief Insertion and deletion counts without formatting patch text. */
    DiffStats stats() const;

    /** @brief Lazily stream the patch; see @ref PatchStream. */
    PatchStream lines() const { return PatchStream(diff_.get()); }

  private:
    git::diff_ptr diff_;
};

/** Tree of @a base against tree of @a target. */
Diff diff_commits(const Repository& repo, const CommitRef& base, const CommitRef& target,
                  const DiffOptions& opts = {});

/** `HEAD` against the working tree, staged changes included. */
Diff diff_head_to_workdir(const Repository& repo, const DiffOptions& opts = {});

/** `HEAD` against the index. */
Diff diff_staged(const Repository& repo, const DiffOptions& opts = {});

/** Index against the working tree. */
Diff diff_unstaged(const Repository& repo, const DiffOptions& opts = {});

const char* delta_status_name(DeltaStatus status);

} // namespace gitsight

#endif // DIFF_HPP
