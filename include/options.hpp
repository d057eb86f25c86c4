#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "diff.hpp"
#include "logger.hpp"
#include "render.hpp"
#include "status.hpp"

enum class Command { Status, List, Diff, Fetch, Pull, Push, Check };

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
    bool to_stderr = false;
};

struct DisplayOptions {
    bool json = false;
    bool no_colors = false;
    std::string custom_color;
    std::string theme_file;
    gitsight::Theme theme;
    bool short_list = false;
};

struct Options {
    Command command = Command::Status;
    std::vector<std::string> args; ///< Positional arguments after the command
    std::filesystem::path repo_dir = ".";
    bool show_help = false;
    bool print_version = false;
    LoggingOptions logging;
    DisplayOptions display;
    gitsight::StatusOptions status;
    gitsight::DiffOptions diff;
    bool staged_only = false;
    bool unstaged_only = false;
    bool stat_only = false;
    size_t limit = 20;
    std::string remote;
    bool force = false;
    std::chrono::seconds timeout{0};
    std::string proxy_url;
    bool auto_config = false;
    std::filesystem::path config_file;
};

using CfgFlagFn = std::function<bool(const std::string&)>;
using CfgOptFn = std::function<std::string(const std::string&)>;

/** @return Every long flag the command line and config files accept. */
const std::set<std::string>& known_option_flags();
/** @return Flags that take a value. */
const std::set<std::string>& value_option_flags();
/** @return Short option letters mapped to their long flags. */
const std::map<char, std::string>& short_option_flags();

/**
 * Parse command-line arguments and configuration files to populate an Options
 * instance. Command-line values win over configuration values.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error on unknown flags, unknown config keys, invalid
 *         values or an unknown command.
 */
Options parse_options(int argc, char* argv[]);

/**
 * Load `--config-yaml`/`--config-json` and, with `--auto-config`, the first
 * `.gitsight.yaml` or `.gitsight.json` found in the repository directory or
 * the current directory.
 *
 * @param cfg_opts    Receives option values keyed by long flag.
 * @param config_file Receives the path of the loaded file, if any.
 */
void load_config_and_auto(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                          std::filesystem::path& config_file);

/** Parse logging, display and theme options. */
void parse_logging_and_display(Options& opts, const ArgParser& parser, const CfgFlagFn& cfg_flag,
                               const CfgOptFn& cfg_opt,
                               const std::map<std::string, std::string>& cfg_opts);

/** Parse status and diff selection options. */
void parse_analysis_options(Options& opts, const ArgParser& parser, const CfgFlagFn& cfg_flag,
                            const CfgOptFn& cfg_opt,
                            const std::map<std::string, std::string>& cfg_opts);

/** @return `false` when @p word names no command. */
bool parse_command(const std::string& word, Command& cmd);

const char* command_name(Command cmd);

#endif // OPTIONS_HPP
