#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include "cli_commands.hpp"
#include "diff.hpp"
#include "divergence.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include "remote.hpp"
#include "render.hpp"
#include "report.hpp"
#include "time_utils.hpp"

using namespace gitsight;

namespace cli {

namespace {

// Commit messages and server text may carry bytes that are not UTF-8.
void write_json(std::ostream& out, const nlohmann::json& j) {
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

Palette palette_for(const Options& opts) {
    return make_palette(opts.display.no_colors, opts.display.custom_color, opts.display.theme);
}

/**
 * @brief Drains a progress channel on its own thread.
 *
 * Transfer counters overwrite one status line; server messages get their
 * own line. Closing happens on destruction, after which the remaining
 * events are still printed before the thread exits.
 */
class ProgressPresenter {
  public:
    ProgressPresenter(ProgressChannel& channel, std::ostream& err, bool enabled)
        : channel_(channel), err_(err), enabled_(enabled), thread_([this] { run(); }) {}

    ~ProgressPresenter() {
        channel_.close();
        if (thread_.joinable())
            thread_.join();
    }

    ProgressPresenter(const ProgressPresenter&) = delete;
    ProgressPresenter& operator=(const ProgressPresenter&) = delete;

  private:
    void run() {
        bool mid_line = false;
        while (auto ev = channel_.receive()) {
            if (!enabled_)
                continue;
            bool line_event =
                ev->stage == ProgressStage::Message || ev->stage == ProgressStage::Done;
            if (line_event) {
                if (mid_line)
                    err_ << "\n";
                err_ << (ev->stage == ProgressStage::Message ? "remote: " : "")
                     << describe(*ev) << "\n";
                mid_line = false;
            } else {
                err_ << "\r" << describe(*ev);
                mid_line = true;
            }
            err_.flush();
        }
        if (enabled_ && mid_line)
            err_ << "\n";
    }

    ProgressChannel& channel_;
    std::ostream& err_;
    bool enabled_;
    std::thread thread_;
};

std::string default_remote(const Repository& repo, const Options& opts) {
    if (!opts.remote.empty())
        return opts.remote;
    HeadInfo head = repo.head();
    if (head.kind == HeadKind::Branch) {
        auto remote = repo.upstream_remote_of(head.refname);
        if (remote && !remote->empty() && *remote != ".")
            return *remote;
    }
    return "origin";
}

Diff select_diff(const Repository& repo, const Options& opts) {
    if (opts.args.empty()) {
        if (opts.staged_only)
            return diff_staged(repo, opts.diff);
        if (opts.unstaged_only)
            return diff_unstaged(repo, opts.diff);
        return diff_head_to_workdir(repo, opts.diff);
    }
    CommitRef base = repo.resolve_ref(opts.args[0]);
    CommitRef target = repo.resolve_ref(opts.args.size() > 1 ? opts.args[1] : "HEAD");
    return diff_commits(repo, base, target, opts.diff);
}

const char* origin_name(LineOrigin origin) {
    switch (origin) {
    case LineOrigin::FileHeader:
        return "file";
    case LineOrigin::HunkHeader:
        return "hunk";
    case LineOrigin::Context:
        return "context";
    case LineOrigin::Addition:
        return "addition";
    case LineOrigin::Deletion:
        return "deletion";
    }
    return "context";
}

} // namespace

int handle_status(const Repository& repo, const Options& opts, std::ostream& out) {
    StatusReport report = build_status_report(repo, opts.status);
    if (opts.display.json) {
        write_json(out, status_json(report));
        return 0;
    }
    out << render(status_document(report), palette_for(opts)) << "\n";
    return 0;
}

int handle_list(const Repository& repo, const Options& opts, std::ostream& out) {
    HeadInfo head = repo.head();
    if (!head.target)
        throw Error(ErrorKind::NotFound, "HEAD has no commits yet");
    auto commits = repo.log(*head.target, opts.limit);
    if (opts.display.json) {
        write_json(out, commits_json(commits));
        return 0;
    }
    out << render(commit_list_document(commits, opts.display.short_list), palette_for(opts))
        << "\n";
    return 0;
}

int handle_diff(const Repository& repo, const Options& opts, std::ostream& out) {
    Diff diff = select_diff(repo, opts);
    log_debug("diff selected", {{"files", std::to_string(diff.num_files())}});
    if (opts.display.json) {
        nlohmann::json j = diff_stats_json(diff.stats());
        if (!opts.stat_only) {
            nlohmann::json lines = nlohmann::json::array();
            PatchStream stream = diff.lines();
            while (auto line = stream.next()) {
                nlohmann::json l;
                l["origin"] = origin_name(line->origin);
                l["content"] = line->content;
                if (line->old_lineno >= 0)
                    l["old_lineno"] = line->old_lineno;
                if (line->new_lineno >= 0)
                    l["new_lineno"] = line->new_lineno;
                lines.push_back(l);
            }
            j["lines"] = lines;
        }
        write_json(out, j);
        return 0;
    }
    Palette palette = palette_for(opts);
    if (opts.stat_only) {
        out << render(diff_stats_document(diff.stats()), palette) << "\n";
        return 0;
    }
    PatchStream stream = diff.lines();
    while (auto line = stream.next())
        out << render(patch_line_node(*line), palette) << "\n";
    return 0;
}

int handle_fetch(const Repository& repo, const Options& opts, std::ostream& out,
                 std::ostream& err) {
    std::string remote = default_remote(repo, opts);
    auto start = std::chrono::steady_clock::now();
    FetchResult result;
    {
        ProgressChannel channel;
        ProgressPresenter presenter(channel, err, !opts.display.json);
        result = fetch_remote(repo, remote, &channel);
    }
    auto took = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() -
                                                                 start);
    if (opts.display.json) {
        nlohmann::json j;
        j["remote"] = result.remote;
        j["received_objects"] = result.received_objects;
        j["total_objects"] = result.total_objects;
        j["received_bytes"] = result.received_bytes;
        write_json(out, j);
        return 0;
    }
    out << "Fetched " << result.remote << ": " << result.received_objects << "/"
        << result.total_objects << " objects, " << result.received_bytes << " bytes in "
        << format_duration_short(took) << "\n";
    return 0;
}

int handle_pull(const Repository& repo, const Options& opts, std::ostream& out,
                std::ostream& err) {
    PullResult result;
    {
        ProgressChannel channel;
        ProgressPresenter presenter(channel, err, !opts.display.json);
        result = pull_fast_forward(repo, opts.force, &channel);
    }
    const auto& d = result.state.divergence;
    if (opts.display.json) {
        nlohmann::json j;
        j["outcome"] = pull_outcome_text(result.outcome);
        j["branch"] = result.state.local_ref;
        j["upstream"] = result.state.upstream_ref;
        j["ahead"] = d.ahead.size();
        j["behind"] = d.behind.size();
        write_json(out, j);
    } else {
        out << pull_outcome_text(result.outcome);
        if (result.outcome == PullOutcome::FastForwarded)
            out << " to " << result.state.upstream.short_hex();
        else if (result.outcome == PullOutcome::Diverged)
            out << " (" << d.ahead.size() << " ahead, " << d.behind.size() << " behind)";
        out << "\n";
    }
    switch (result.outcome) {
    case PullOutcome::UpToDate:
    case PullOutcome::FastForwarded:
    case PullOutcome::Ahead:
        return 0;
    case PullOutcome::LocalChanges:
    case PullOutcome::Diverged:
        break;
    }
    return 1;
}

int handle_push(const Repository& repo, const Options& opts, std::ostream& out,
                std::ostream& err) {
    PushPlan plan = plan_push(repo, opts.remote, opts.force);
    auto state = upstream_divergence(repo);
    if (state && state->remote_name == plan.remote) {
        Relation rel = classify_divergence(state->divergence);
        if (rel == Relation::UpToDate) {
            out << "Everything up-to-date\n";
            return 0;
        }
        if ((rel == Relation::Behind || rel == Relation::Diverged) && !opts.force) {
            err << "Upstream " << state->upstream_ref << " has "
                << state->divergence.behind.size()
                << " commit(s) this branch lacks; pull first or use --force\n";
            return 1;
        }
    }
    PushResult result;
    {
        ProgressChannel channel;
        ProgressPresenter presenter(channel, err, !opts.display.json);
        result = push_branch(repo, plan.remote, plan.refspec, plan.expected, &channel);
    }
    if (opts.display.json) {
        nlohmann::json j;
        j["remote"] = result.remote;
        j["refspec"] = result.refspec;
        j["expected"] = plan.expected ? nlohmann::json(plan.expected->hex()) : nlohmann::json();
        write_json(out, j);
        return 0;
    }
    out << "Pushed " << result.refspec << " to " << result.remote << "\n";
    return 0;
}

int handle_check(const Repository& repo, const Options& opts, std::ostream& out) {
    auto state = upstream_divergence(repo);
    if (!state)
        throw Error(ErrorKind::NotFound, "current branch has no upstream");
    Relation rel = classify_divergence(state->divergence);
    const auto& d = state->divergence;
    std::string base = d.merge_base ? d.merge_base->hex() : "";
    if (opts.display.json) {
        nlohmann::json j;
        j["relation"] = relation_name(rel);
        j["branch"] = state->local_ref;
        j["upstream"] = state->upstream_ref;
        j["ahead"] = d.ahead.size();
        j["behind"] = d.behind.size();
        j["merge_base"] = base;
        write_json(out, j);
    } else {
        out << relation_name(rel) << " ahead=" << d.ahead.size() << " behind=" << d.behind.size()
            << " base=" << (d.merge_base ? d.merge_base->short_hex() : "-") << "\n";
    }
    return rel == Relation::Diverged ? 1 : 0;
}

int run_command(const Options& opts, std::ostream& out, std::ostream& err) {
    log_debug("running command", {{"command", command_name(opts.command)},
                                  {"dir", opts.repo_dir.string()}});
    try {
        Repository repo = Repository::open(opts.repo_dir);
        log_debug("repository opened", {{"workdir", repo.workdir().string()},
                                        {"gitdir", repo.gitdir().string()}});
        switch (opts.command) {
        case Command::Status:
            return handle_status(repo, opts, out);
        case Command::List:
            return handle_list(repo, opts, out);
        case Command::Diff:
            return handle_diff(repo, opts, out);
        case Command::Fetch:
            return handle_fetch(repo, opts, out, err);
        case Command::Pull:
            return handle_pull(repo, opts, out, err);
        case Command::Push:
            return handle_push(repo, opts, out, err);
        case Command::Check:
            return handle_check(repo, opts, out);
        }
    } catch (const Error& e) {
        log_error(e.what(), {{"kind", error_kind_name(e.kind())},
                             {"command", command_name(opts.command)}});
        err << "error: " << e.what() << "\n";
        return exit_code_for(e.kind());
    }
    return 1;
}

} // namespace cli
