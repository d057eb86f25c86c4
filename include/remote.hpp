#ifndef REMOTE_HPP
#define REMOTE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include "divergence.hpp"
#include "object_store.hpp"
#include "progress.hpp"

namespace gitsight {

struct FetchResult {
    std::string remote;
    std::size_t received_objects = 0;
    std::size_t total_objects = 0;
    std::size_t received_bytes = 0;
    std::string server_message;
};

/**
 * @brief Fetch @a remote using its configured refspecs.
 *
 * Progress is published to @a progress when given; the caller owns the
 * consuming thread.
 */
FetchResult fetch_remote(const Repository& repo, const std::string& remote,
                         ProgressChannel* progress = nullptr);

/**
 * @brief What a push of the current branch would send and where.
 */
struct PushPlan {
    std::string remote;
    std::string refspec;              ///< `[+]refs/heads/x:refs/heads/y`
    std::optional<CommitRef> expected; ///< Last observed remote tip
};

/**
 * @brief Work out the push of `HEAD`'s branch.
 *
 * The destination is the upstream branch when one is configured, otherwise
 * the same branch name. @a remote_override wins over the upstream's remote;
 * `origin` is the fallback. `expected` is the tip of the remote-tracking ref
 * when it exists.
 *
 * @throws Error `NotFound` when HEAD is not on a branch.
 */
PushPlan plan_push(const Repository& repo, const std::string& remote_override, bool force);

struct PushResult {
    std::string remote;
    std::string refspec;
    std::string server_message;
};

/**
 * @brief Push @a refspec to @a remote, guarded by push negotiation.
 *
 * @throws Error `NegotiationRejected` when the remote ref no longer matches
 *         @a expected or the server refuses a ref update.
 */
PushResult push_branch(const Repository& repo, const std::string& remote,
                       const std::string& refspec, const std::optional<CommitRef>& expected,
                       ProgressChannel* progress = nullptr);

enum class PullOutcome { UpToDate, FastForwarded, LocalChanges, Ahead, Diverged };

struct PullResult {
    PullOutcome outcome = PullOutcome::UpToDate;
    UpstreamState state;
};

/**
 * @brief Fetch the upstream and fast-forward when only the remote moved.
 *
 * Refuses when local changes exist unless @a force is set, and never merges
 * or rebases: ahead and diverged branches are reported, not touched.
 *
 * @throws Error `NotFound` when the branch has no upstream.
 */
PullResult pull_fast_forward(const Repository& repo, bool force,
                             ProgressChannel* progress = nullptr);

const char* pull_outcome_text(PullOutcome outcome);

} // namespace gitsight

#endif // REMOTE_HPP
