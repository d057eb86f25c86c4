#pragma once

#include <iostream>
#include <ostream>

#include "object_store.hpp"
#include "options.hpp"

namespace cli {

/**
 * @brief Open the repository named by @a opts and run its command.
 *
 * Errors raised by the analysis core are logged, printed to @a err as
 * `error: <message>` and mapped to their exit code; any other exception
 * propagates to the caller.
 *
 * @return Process exit code.
 */
int run_command(const Options& opts, std::ostream& out = std::cout,
                std::ostream& err = std::cerr);

/** @brief Branch line, in-progress state, change groups and commit groups. */
int handle_status(const gitsight::Repository& repo, const Options& opts, std::ostream& out);

/** @brief Newest-first commit log of HEAD. */
int handle_list(const gitsight::Repository& repo, const Options& opts, std::ostream& out);

/**
 * @brief Patch or statistics between HEAD and the working tree, or between
 *        one or two revisions.
 */
int handle_diff(const gitsight::Repository& repo, const Options& opts, std::ostream& out);

/** @brief Fetch the upstream's remote with progress on @a err. */
int handle_fetch(const gitsight::Repository& repo, const Options& opts, std::ostream& out,
                 std::ostream& err);

/**
 * @brief Fetch, then fast-forward when only the upstream moved.
 *
 * @return `0` when up to date, fast-forwarded or only ahead; `1` when local
 *         changes or divergence block the fast-forward.
 */
int handle_pull(const gitsight::Repository& repo, const Options& opts, std::ostream& out,
                std::ostream& err);

/**
 * @brief Push HEAD's branch guarded by the last observed remote tip.
 *
 * Refuses without contacting the remote when the upstream has commits the
 * branch lacks, unless `--force` is given.
 */
int handle_push(const gitsight::Repository& repo, const Options& opts, std::ostream& out,
                std::ostream& err);

/**
 * @brief Print the divergence gate decision for scripts.
 *
 * @return `0` for up-to-date, ahead or behind; `1` when diverged.
 */
int handle_check(const gitsight::Repository& repo, const Options& opts, std::ostream& out);

} // namespace cli
