/**
 * @file gitsight.cpp
 * @brief CLI entry point for the repository inspector.
 *
 * Parses options, sets up logging and libgit2 globals, then hands the
 * selected command to the command layer.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

namespace {

void setup_logging(const LoggingOptions& log) {
    init_logger(log.log_file, log.log_level, log.max_log_size, log.max_log_files);
    set_json_logging(log.json_log);
    set_log_compression(log.compress_logs);
    set_log_stderr(log.to_stderr);
    if (log.use_syslog)
        init_syslog(log.syslog_facility);
}

} // namespace

/**
 * @brief Application entry point.
 *
 * @return int Zero on success or when printing help/version; the command's
 *             exit code otherwise; 1 on invalid options or unexpected errors.
 */
#ifndef GITSIGHT_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << GITSIGHT_VERSION << "\n";
            return 0;
        }
        setup_logging(opts.logging);
        git::set_proxy(opts.proxy_url);
        if (opts.timeout.count() > 0)
            git::set_libgit_timeout(static_cast<unsigned int>(opts.timeout.count()));
        if (!opts.config_file.empty())
            log_debug("loaded config", {{"path", opts.config_file.string()}});
        int rc = cli::run_command(opts);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        log_error(e.what());
        shutdown_logger();
        std::cerr << e.what() << "\n";
        return 1;
    }
}
#endif // GITSIGHT_NO_MAIN
