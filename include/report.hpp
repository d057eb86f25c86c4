#ifndef REPORT_HPP
#define REPORT_HPP

#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "diff.hpp"
#include "divergence.hpp"
#include "object_store.hpp"
#include "sequencer.hpp"
#include "status.hpp"

namespace gitsight {

/**
 * @brief Point-in-time picture of a repository as shown by `status`.
 *
 * Built in one pass from the divergence walker, the status classifier and
 * the sequencer reader.
 */
struct StatusReport {
    HeadInfo head;
    std::optional<CommitMeta> head_commit; ///< Unset when HEAD is unborn
    std::optional<UpstreamState> upstream;
    RepoState state = RepoState::None;
    /// Remaining rebase steps; unset when no todo file exists.
    std::optional<std::vector<SequencerOp>> pending;
    std::vector<StatusEntry> changes;
    std::vector<CommitMeta> unmerged; ///< Local commits missing upstream
    std::vector<CommitMeta> unpulled; ///< Upstream commits missing locally
};

/**
 * @brief Assemble a @ref StatusReport.
 *
 * Errors from any of the underlying readers propagate unchanged; no part of
 * the report is silently left empty because of a failure.
 */
StatusReport build_status_report(const Repository& repo, const StatusOptions& opts = {});

nlohmann::json commit_json(const CommitMeta& commit);
nlohmann::json commits_json(const std::vector<CommitMeta>& commits);
nlohmann::json status_json(const StatusReport& report);
nlohmann::json diff_stats_json(const DiffStats& stats);

} // namespace gitsight

#endif // REPORT_HPP
