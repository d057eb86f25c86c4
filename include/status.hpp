#ifndef STATUS_HPP
#define STATUS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "object_store.hpp"

namespace gitsight {

/// Where a change lives: staged in the index or only in the working tree.
enum class Location { Index, WorkingTree };

enum class Change { New, Modified, Renamed, Deleted, TypeChanged, Ignored, Unknown };

/**
 * @brief One classified change of one path in one location.
 *
 * A path that differs both in the index and in the working tree yields two
 * entries.
 */
struct StatusEntry {
    std::string path;
    std::optional<std::string> old_path; ///< Source path of a rename
    Location location = Location::WorkingTree;
    Change change = Change::Unknown;
};

struct StatusOptions {
    bool include_ignored = false;
    bool include_untracked = true;
    bool recurse_untracked_dirs = true;
    bool detect_renames = true;
    std::uint16_t rename_threshold = 50; ///< Similarity percentage
    bool exclude_submodules = true;
    std::vector<std::string> pathspec;
};

/**
 * @brief Classify every uncommitted change in the repository.
 *
 * Index entries come first, then working tree entries; each group is sorted
 * by path. When several kinds apply to one path in one location the
 * strongest wins: Renamed, Modified, New, Deleted, TypeChanged, Ignored,
 * Unknown.
 *
 * @throws Error `MalformedState` if any path is not valid UTF-8.
 */
std::vector<StatusEntry> classify(const Repository& repo, const StatusOptions& opts = {});

/** @return `true` when @ref classify reports nothing. */
bool is_clean(const Repository& repo, const StatusOptions& opts = {});

const char* change_name(Change change);
const char* location_name(Location location);

} // namespace gitsight

#endif // STATUS_HPP
