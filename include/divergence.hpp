#ifndef DIVERGENCE_HPP
#define DIVERGENCE_HPP

#include <optional>
#include <string>
#include <vector>
#include "object_store.hpp"

namespace gitsight {

/**
 * @brief Commits unique to each side of a local/remote pair.
 *
 * `ahead` holds commits reachable from the local tip but not from the merge
 * base, `behind` the same for the remote tip. Both lists are newest first in
 * topological order and never share a commit.
 */
struct DivergenceSet {
    std::optional<CommitRef> merge_base;
    std::vector<CommitRef> ahead;
    std::vector<CommitRef> behind;

    bool in_sync() const { return ahead.empty() && behind.empty(); }
};

/// Gate decision derived from a @ref DivergenceSet.
enum class Relation { UpToDate, Ahead, Behind, Diverged };

/**
 * @brief Compute which commits each side has that the other lacks.
 *
 * @throws Error `UnrelatedHistory` when the commits share no ancestor,
 *         `NotFound` when either commit is missing.
 */
DivergenceSet ahead_behind(const Repository& repo, const CommitRef& local,
                           const CommitRef& remote);

Relation classify_divergence(const DivergenceSet& set);

const char* relation_name(Relation relation);

/**
 * @brief Current branch measured against its configured upstream.
 */
struct UpstreamState {
    std::string local_ref;    ///< e.g. `refs/heads/main`
    std::string upstream_ref; ///< e.g. `refs/remotes/origin/main`
    std::string remote_name;  ///< e.g. `origin`
    CommitRef local;
    CommitRef upstream;
    DivergenceSet divergence;
};

/**
 * @brief Divergence of `HEAD`'s branch from its upstream.
 *
 * @return `std::nullopt` when HEAD is detached or unborn, or when the branch
 *         has no upstream configured.
 * @throws Error `NotFound` when the upstream is configured but its
 *         tracking ref does not exist.
 */
std::optional<UpstreamState> upstream_divergence(const Repository& repo);

} // namespace gitsight

#endif // DIVERGENCE_HPP
