#include "report.hpp"
#include "logger.hpp"

namespace gitsight {

static std::vector<CommitMeta> read_commits(const Repository& repo,
                                            const std::vector<CommitRef>& ids) {
    std::vector<CommitMeta> out;
    out.reserve(ids.size());
    for (const auto& id : ids)
        out.push_back(repo.read_commit(id));
    return out;
}

StatusReport build_status_report(const Repository& repo, const StatusOptions& opts) {
    StatusReport report;
    report.head = repo.head();
    if (report.head.target)
        report.head_commit = repo.read_commit(*report.head.target);

    report.upstream = upstream_divergence(repo);
    if (report.upstream) {
        report.unmerged = read_commits(repo, report.upstream->divergence.ahead);
        report.unpulled = read_commits(repo, report.upstream->divergence.behind);
    }

    report.state = repository_state(repo);
    if (report.state != RepoState::None)
        report.pending = read_pending_operations(repo);

    report.changes = classify(repo, opts);
    log_debug("status report built", {{"changes", std::to_string(report.changes.size())},
                                      {"unmerged", std::to_string(report.unmerged.size())},
                                      {"unpulled", std::to_string(report.unpulled.size())},
                                      {"state", repo_state_name(report.state)}});
    return report;
}

static const char* head_kind_name(HeadKind kind) {
    switch (kind) {
    case HeadKind::Branch:
        return "branch";
    case HeadKind::Detached:
        return "detached";
    case HeadKind::Unborn:
        return "unborn";
    }
    return "unborn";
}

nlohmann::json commit_json(const CommitMeta& commit) {
    nlohmann::json j;
    j["id"] = commit.id.hex();
    nlohmann::json parents = nlohmann::json::array();
    for (const auto& p : commit.parents)
        parents.push_back(p.hex());
    j["parents"] = parents;
    j["author"] = {{"name", commit.author_name}, {"email", commit.author_email}};
    j["time"] = commit.time;
    j["offset_minutes"] = commit.offset_minutes;
    j["summary"] = commit.summary;
    j["message"] = commit.message;
    j["signed"] = commit.is_signed();
    return j;
}

nlohmann::json commits_json(const std::vector<CommitMeta>& commits) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : commits)
        arr.push_back(commit_json(c));
    return arr;
}

nlohmann::json status_json(const StatusReport& report) {
    nlohmann::json j;
    nlohmann::json head;
    head["kind"] = head_kind_name(report.head.kind);
    head["ref"] = report.head.refname;
    head["name"] = report.head.shorthand;
    head["commit"] =
        report.head.target ? nlohmann::json(report.head.target->hex()) : nlohmann::json(nullptr);
    if (report.head_commit)
        head["summary"] = report.head_commit->summary;
    j["head"] = head;

    if (report.upstream) {
        const auto& up = *report.upstream;
        nlohmann::json u;
        u["ref"] = up.upstream_ref;
        u["remote"] = up.remote_name;
        u["commit"] = up.upstream.hex();
        u["merge_base"] = up.divergence.merge_base
                              ? nlohmann::json(up.divergence.merge_base->hex())
                              : nlohmann::json(nullptr);
        u["ahead"] = up.divergence.ahead.size();
        u["behind"] = up.divergence.behind.size();
        u["relation"] = relation_name(classify_divergence(up.divergence));
        j["upstream"] = u;
    } else {
        j["upstream"] = nullptr;
    }

    j["state"] = repo_state_name(report.state);
    if (report.pending) {
        nlohmann::json ops = nlohmann::json::array();
        for (const auto& op : *report.pending) {
            nlohmann::json o;
            o["verb"] = verb_name(op.verb);
            if (op.verb != SequencerVerb::Exec)
                o["commit"] = op.target.hex();
            o["message"] = op.message;
            ops.push_back(o);
        }
        j["pending"] = ops;
    }

    nlohmann::json changes = nlohmann::json::array();
    for (const auto& e : report.changes) {
        nlohmann::json c;
        c["path"] = e.path;
        if (e.old_path)
            c["old_path"] = *e.old_path;
        c["location"] = location_name(e.location);
        c["change"] = change_name(e.change);
        changes.push_back(c);
    }
    j["changes"] = changes;
    j["unmerged"] = commits_json(report.unmerged);
    j["unpulled"] = commits_json(report.unpulled);
    return j;
}

nlohmann::json diff_stats_json(const DiffStats& stats) {
    nlohmann::json j;
    j["insertions"] = stats.insertions;
    j["deletions"] = stats.deletions;
    nlohmann::json files = nlohmann::json::array();
    for (const auto& f : stats.files) {
        nlohmann::json entry = {{"old_path", f.old_path},
                                {"new_path", f.new_path},
                                {"status", delta_status_name(f.status)},
                                {"insertions", f.insertions},
                                {"deletions", f.deletions},
                                {"binary", f.binary}};
        files.push_back(entry);
    }
    j["files"] = files;
    return j;
}

} // namespace gitsight
