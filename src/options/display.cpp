// options/display.cpp
//
// Parse logging and output presentation related flags/options.

#include <climits>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

void parse_logging_and_display(Options& opts, const ArgParser& parser, const CfgFlagFn& cfg_flag,
                               const CfgOptFn& cfg_opt,
                               const std::map<std::string, std::string>& cfg_opts) {
    bool ok = false;
    if (parser.has_flag("--log-file") || cfg_opts.count("--log-file")) {
        std::string val = parser.get_option("--log-file");
        if (val.empty())
            val = cfg_opt("--log-file");
        if (val.empty())
            throw std::runtime_error("--log-file requires a path");
        opts.logging.log_file = val;
    }
    if (parser.has_flag("--verbose") || cfg_flag("--verbose")) {
        opts.logging.log_level = LogLevel::DEBUG;
        opts.logging.to_stderr = true;
    }
    if (parser.has_flag("--log-level") || cfg_opts.count("--log-level")) {
        std::string val = parser.get_option("--log-level");
        if (val.empty())
            val = cfg_opt("--log-level");
        if (val.empty())
            throw std::runtime_error("--log-level requires a value");
        if (!parse_log_level(val, opts.logging.log_level))
            throw std::runtime_error("Invalid log level: " + val);
    }
    if (parser.has_flag("--max-log-size") || cfg_opts.count("--max-log-size")) {
        std::string val = parser.get_option("--max-log-size");
        if (val.empty())
            val = cfg_opt("--max-log-size");
        opts.logging.max_log_size = parse_bytes(val, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (parser.has_flag("--max-log-files") || cfg_opts.count("--max-log-files")) {
        std::string val = parser.get_option("--max-log-files");
        if (val.empty())
            val = cfg_opt("--max-log-files");
        opts.logging.max_log_files = parse_size_t(val, 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    opts.logging.json_log = parser.has_flag("--json-log") || cfg_flag("--json-log");
    opts.logging.compress_logs = parser.has_flag("--compress-logs") || cfg_flag("--compress-logs");
    opts.logging.use_syslog = parser.has_flag("--syslog") || cfg_flag("--syslog");
    if (parser.has_flag("--syslog-facility") || cfg_opts.count("--syslog-facility")) {
        std::string val = parser.get_option("--syslog-facility");
        if (val.empty())
            val = cfg_opt("--syslog-facility");
        int fac = parse_int(val, 0, INT_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility");
        opts.logging.syslog_facility = fac;
    }

    opts.display.json = parser.has_flag("--json") || cfg_flag("--json");
    opts.display.short_list = parser.has_flag("--short") || cfg_flag("--short");
    opts.display.no_colors = parser.has_flag("--no-colors") || cfg_flag("--no-colors");
    if (parser.has_flag("--color") || cfg_opts.count("--color")) {
        std::string val = parser.get_option("--color");
        if (val.empty())
            val = cfg_opt("--color");
        opts.display.custom_color = val;
    }
    if (parser.has_flag("--theme") || cfg_opts.count("--theme")) {
        std::string val = parser.get_option("--theme");
        if (val.empty())
            val = cfg_opt("--theme");
        opts.display.theme_file = val;
        if (!val.empty()) {
            std::string err;
            if (!load_theme(val, opts.display.theme, err))
                throw std::runtime_error("Failed to load theme: " + err);
        }
    }
}
