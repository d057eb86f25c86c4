#include "divergence.hpp"
#include <algorithm>
#include <unordered_set>
#include "errors.hpp"
#include "logger.hpp"

namespace gitsight {

static void drop_shared(std::vector<CommitRef>& list,
                        const std::unordered_set<CommitRef, CommitRefHash>& other) {
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const CommitRef& c) { return other.count(c) > 0; }),
               list.end());
}

DivergenceSet ahead_behind(const Repository& repo, const CommitRef& local,
                           const CommitRef& remote) {
    DivergenceSet out;
    if (local == remote) {
        repo.read_commit(local); // an unknown id is NotFound even when both sides agree
        out.merge_base = local;
        return out;
    }
    out.merge_base = repo.merge_base(local, remote);
    if (!out.merge_base)
        throw Error(ErrorKind::UnrelatedHistory,
                    "no common ancestor between " + local.hex() + " and " + remote.hex());
    out.ahead = repo.walk(local, out.merge_base);
    out.behind = repo.walk(remote, out.merge_base);

    // Criss-cross histories can leave commits reachable from both tips above
    // the chosen base; those are common to both sides.
    std::unordered_set<CommitRef, CommitRefHash> ahead_set(out.ahead.begin(), out.ahead.end());
    std::unordered_set<CommitRef, CommitRefHash> behind_set(out.behind.begin(), out.behind.end());
    drop_shared(out.ahead, behind_set);
    drop_shared(out.behind, ahead_set);

    log_debug("divergence computed", {{"local", local.short_hex()},
                                      {"remote", remote.short_hex()},
                                      {"ahead", std::to_string(out.ahead.size())},
                                      {"behind", std::to_string(out.behind.size())}});
    return out;
}

Relation classify_divergence(const DivergenceSet& set) {
    if (set.ahead.empty() && set.behind.empty())
        return Relation::UpToDate;
    if (set.behind.empty())
        return Relation::Ahead;
    if (set.ahead.empty())
        return Relation::Behind;
    return Relation::Diverged;
}

const char* relation_name(Relation relation) {
    switch (relation) {
    case Relation::UpToDate:
        return "up-to-date";
    case Relation::Ahead:
        return "ahead";
    case Relation::Behind:
        return "behind";
    case Relation::Diverged:
        return "diverged";
    }
    return "unknown";
}

std::optional<UpstreamState> upstream_divergence(const Repository& repo) {
    HeadInfo head = repo.head();
    if (head.kind != HeadKind::Branch || !head.target)
        return std::nullopt;
    auto upstream_ref = repo.upstream_of(head.refname);
    if (!upstream_ref)
        return std::nullopt;
    auto tracking = repo.lookup_reference(*upstream_ref);
    if (!tracking)
        throw Error(ErrorKind::NotFound,
                    "upstream " + *upstream_ref + " of " + head.shorthand + " does not exist");

    UpstreamState state;
    state.local_ref = head.refname;
    state.upstream_ref = *upstream_ref;
    state.remote_name = repo.upstream_remote_of(head.refname).value_or("");
    state.local = *head.target;
    state.upstream = repo.resolve_ref(*upstream_ref);
    state.divergence = ahead_behind(repo, state.local, state.upstream);
    return state;
}

} // namespace gitsight
