#include "remote.hpp"
#include <vector>
#include "errors.hpp"
#include "logger.hpp"
#include "push_guard.hpp"
#include "status.hpp"

namespace gitsight {

namespace {

struct TransferContext {
    ProgressChannel* progress = nullptr;
    std::string server_message;
    std::optional<CommitRef> expected;
    bool rejected = false;
    std::string reason;
    std::vector<std::string> ref_errors;
    git::CredentialAttempts credentials;
    std::string callback_error;
};

void publish(TransferContext* ctx, ProgressEvent ev) {
    if (ctx->progress)
        ctx->progress->publish(std::move(ev));
}

// Callbacks run inside libgit2; exceptions stop here and abort the transfer.
int fail_callback(TransferContext* ctx, const std::exception& e) {
    ctx->callback_error = e.what();
    git_error_set_str(GIT_ERROR_CALLBACK, ctx->callback_error.c_str());
    return GIT_EUSER;
}

int sideband_cb(const char* str, int len, void* payload) {
    auto* ctx = static_cast<TransferContext*>(payload);
    try {
        std::string text(str, static_cast<size_t>(len));
        size_t start = 0;
        while (start < text.size()) {
            size_t end = text.find_first_of("\r\n", start);
            if (end == std::string::npos)
                end = text.size();
            std::string piece = text.substr(start, end - start);
            start = end + 1;
            if (piece.empty())
                continue;
            if (auto ev = parse_sideband(piece)) {
                publish(ctx, *ev);
            } else {
                ctx->server_message += piece + "\n";
                publish(ctx, ProgressEvent{ProgressStage::Message, 0, 0, piece});
            }
        }
    } catch (const std::exception& e) {
        return fail_callback(ctx, e);
    }
    return 0;
}

int indexer_cb(const git_indexer_progress* stats, void* payload) {
    auto* ctx = static_cast<TransferContext*>(payload);
    try {
        if (stats->total_deltas > 0 && stats->received_objects == stats->total_objects)
            publish(ctx, ProgressEvent{ProgressStage::Resolving, stats->indexed_deltas,
                                       stats->total_deltas, ""});
        else
            publish(ctx, ProgressEvent{ProgressStage::Receiving, stats->received_objects,
                                       stats->total_objects, ""});
    } catch (const std::exception& e) {
        return fail_callback(ctx, e);
    }
    return 0;
}

int push_transfer_cb(unsigned int current, unsigned int total, size_t bytes, void* payload) {
    (void)bytes;
    auto* ctx = static_cast<TransferContext*>(payload);
    try {
        publish(ctx, ProgressEvent{ProgressStage::Pushing, current, total, ""});
    } catch (const std::exception& e) {
        return fail_callback(ctx, e);
    }
    return 0;
}

int negotiation_cb(const git_push_update** updates, size_t len, void* payload) {
    auto* ctx = static_cast<TransferContext*>(payload);
    try {
        std::vector<PushUpdate> proposed;
        proposed.reserve(len);
        for (size_t i = 0; i < len; ++i) {
            const git_push_update* u = updates[i];
            proposed.push_back(PushUpdate{u->src_refname ? u->src_refname : "",
                                          u->dst_refname ? u->dst_refname : "",
                                          CommitRef(u->src), CommitRef(u->dst)});
        }
        if (check_push_negotiation(ctx->expected, proposed, &ctx->reason))
            return 0;
    } catch (const std::exception& e) {
        return fail_callback(ctx, e);
    }
    ctx->rejected = true;
    git_error_set_str(GIT_ERROR_CALLBACK, ctx->reason.c_str());
    return GIT_EUSER;
}

int update_reference_cb(const char* refname, const char* status, void* payload) {
    auto* ctx = static_cast<TransferContext*>(payload);
    try {
        if (status)
            ctx->ref_errors.push_back(std::string(refname) + ": " + status);
    } catch (const std::exception& e) {
        return fail_callback(ctx, e);
    }
    return 0;
}

int credentials_cb(git_credential** out, const char* url, const char* username_from_url,
                   unsigned int allowed_types, void* payload) {
    auto* ctx = static_cast<TransferContext*>(payload);
    try {
        return git::credential_cb(out, url, username_from_url, allowed_types, &ctx->credentials);
    } catch (const std::exception& e) {
        return fail_callback(ctx, e);
    }
}

void apply_proxy(git_proxy_options& po) {
    if (git::proxy_url().empty())
        return;
    po.type = GIT_PROXY_SPECIFIED;
    po.url = git::proxy_url().c_str();
}

git::remote_ptr lookup_remote(const Repository& repo, const std::string& name) {
    git_remote* raw = nullptr;
    git::check(git_remote_lookup(&raw, repo.raw(), name.c_str()), "lookup remote " + name);
    return git::remote_ptr(raw);
}

} // namespace

FetchResult fetch_remote(const Repository& repo, const std::string& remote,
                         ProgressChannel* progress) {
    git::remote_ptr handle = lookup_remote(repo, remote);
    TransferContext ctx;
    ctx.progress = progress;
    git_fetch_options fo = GIT_FETCH_OPTIONS_INIT;
    fo.callbacks.credentials = credentials_cb;
    fo.callbacks.sideband_progress = sideband_cb;
    fo.callbacks.transfer_progress = indexer_cb;
    fo.callbacks.payload = &ctx;
    apply_proxy(fo.proxy_opts);
    log_info("fetching", {{"remote", remote}});
    int rc = git_remote_fetch(handle.get(), nullptr, &fo, "fetch");
    if (!ctx.callback_error.empty())
        throw Error(ErrorKind::Git, "fetch " + remote + ": " + ctx.callback_error);
    git::check(rc, "fetch " + remote);

    FetchResult out;
    out.remote = remote;
    out.server_message = ctx.server_message;
    if (const git_indexer_progress* stats = git_remote_stats(handle.get())) {
        out.received_objects = stats->received_objects;
        out.total_objects = stats->total_objects;
        out.received_bytes = stats->received_bytes;
    }
    if (progress)
        progress->publish(ProgressEvent{ProgressStage::Done, out.received_objects,
                                        out.total_objects, "fetched " + remote});
    return out;
}

PushPlan plan_push(const Repository& repo, const std::string& remote_override, bool force) {
    HeadInfo head = repo.head();
    if (head.kind != HeadKind::Branch)
        throw Error(ErrorKind::NotFound, "HEAD is not on a branch; nothing to push");
    auto upstream = repo.upstream_of(head.refname);
    auto upstream_remote = repo.upstream_remote_of(head.refname);

    PushPlan plan;
    if (!remote_override.empty())
        plan.remote = remote_override;
    else if (upstream_remote && !upstream_remote->empty() && *upstream_remote != ".")
        plan.remote = *upstream_remote;
    else
        plan.remote = "origin";

    std::string dst = head.refname;
    if (upstream && upstream_remote && plan.remote == *upstream_remote) {
        const std::string prefix = "refs/remotes/" + plan.remote + "/";
        if (upstream->rfind(prefix, 0) == 0)
            dst = "refs/heads/" + upstream->substr(prefix.size());
        if (auto tracking = repo.lookup_reference(*upstream); tracking && tracking->target)
            plan.expected = tracking->target;
    } else {
        std::string tracking_name = "refs/remotes/" + plan.remote + "/" + head.shorthand;
        if (auto tracking = repo.lookup_reference(tracking_name); tracking && tracking->target)
            plan.expected = tracking->target;
    }
    plan.refspec = (force ? "+" : "") + head.refname + ":" + dst;
    return plan;
}

PushResult push_branch(const Repository& repo, const std::string& remote,
                       const std::string& refspec, const std::optional<CommitRef>& expected,
                       ProgressChannel* progress) {
    git::remote_ptr handle = lookup_remote(repo, remote);
    TransferContext ctx;
    ctx.progress = progress;
    ctx.expected = expected;
    git_push_options po = GIT_PUSH_OPTIONS_INIT;
    po.callbacks.credentials = credentials_cb;
    po.callbacks.sideband_progress = sideband_cb;
    po.callbacks.push_transfer_progress = push_transfer_cb;
    po.callbacks.push_negotiation = negotiation_cb;
    po.callbacks.push_update_reference = update_reference_cb;
    po.callbacks.payload = &ctx;
    apply_proxy(po.proxy_opts);

    std::vector<std::string> specs{refspec};
    git::StrArray refspecs(specs);
    log_info("pushing", {{"remote", remote},
                         {"refspec", refspec},
                         {"expected", expected ? expected->hex() : "none"}});
    int rc = git_remote_push(handle.get(), refspecs.get(), &po);
    if (!ctx.callback_error.empty())
        throw Error(ErrorKind::Git, "push to " + remote + ": " + ctx.callback_error);
    if (ctx.rejected)
        throw Error(ErrorKind::NegotiationRejected, ctx.reason);
    git::check(rc, "push to " + remote);
    if (!ctx.ref_errors.empty())
        throw Error(ErrorKind::NegotiationRejected, "remote rejected " + ctx.ref_errors.front());
    if (progress)
        progress->publish(ProgressEvent{ProgressStage::Done, 0, 0, "pushed " + refspec});
    return PushResult{remote, refspec, ctx.server_message};
}

PullResult pull_fast_forward(const Repository& repo, bool force, ProgressChannel* progress) {
    auto before = upstream_divergence(repo);
    if (!before)
        throw Error(ErrorKind::NotFound, "current branch has no upstream to pull from");
    if (!before->remote_name.empty() && before->remote_name != ".")
        fetch_remote(repo, before->remote_name, progress);

    PullResult out;
    auto state = upstream_divergence(repo);
    if (!state)
        throw Error(ErrorKind::NotFound, "upstream disappeared during fetch");
    out.state = *state;
    switch (classify_divergence(state->divergence)) {
    case Relation::UpToDate:
        out.outcome = PullOutcome::UpToDate;
        return out;
    case Relation::Ahead:
        out.outcome = PullOutcome::Ahead;
        return out;
    case Relation::Diverged:
        out.outcome = PullOutcome::Diverged;
        return out;
    case Relation::Behind:
        break;
    }
    if (!force && !is_clean(repo)) {
        out.outcome = PullOutcome::LocalChanges;
        return out;
    }
    git_object* raw = nullptr;
    git::check(git_object_lookup(&raw, repo.raw(), &state->upstream.oid(), GIT_OBJECT_COMMIT),
               "lookup " + state->upstream.hex());
    git::object_ptr target(raw);
    git::check(git_reset(repo.raw(), target.get(), GIT_RESET_HARD, nullptr),
               "fast-forward to " + state->upstream.short_hex());
    log_info("fast-forwarded", {{"branch", state->local_ref},
                                {"from", state->local.short_hex()},
                                {"to", state->upstream.short_hex()}});
    out.outcome = PullOutcome::FastForwarded;
    out.state.local = state->upstream;
    out.state.divergence = DivergenceSet{state->upstream, {}, {}};
    return out;
}

const char* pull_outcome_text(PullOutcome outcome) {
    switch (outcome) {
    case PullOutcome::UpToDate:
        return "Already up to date";
    case PullOutcome::FastForwarded:
        return "Fast-forwarded";
    case PullOutcome::LocalChanges:
        return "Local changes present";
    case PullOutcome::Ahead:
        return "Nothing to pull; local branch is ahead";
    case PullOutcome::Diverged:
        return "Unable to fast-forward; branches have diverged";
    }
    return "";
}

} // namespace gitsight
