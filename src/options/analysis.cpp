// options/analysis.cpp
//
// Parse status classification and diff selection flags/options.

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include "options.hpp"
#include "parse_utils.hpp"

static gitsight::Whitespace parse_whitespace_mode(const std::string& val) {
    if (val == "none")
        return gitsight::Whitespace::Exact;
    if (val == "all")
        return gitsight::Whitespace::IgnoreAll;
    if (val == "change")
        return gitsight::Whitespace::IgnoreChange;
    if (val == "eol")
        return gitsight::Whitespace::IgnoreEol;
    throw std::runtime_error("Invalid value for --ignore-whitespace: " + val);
}

void parse_analysis_options(Options& opts, const ArgParser& parser, const CfgFlagFn& cfg_flag,
                            const CfgOptFn& cfg_opt,
                            const std::map<std::string, std::string>& cfg_opts) {
    bool ok = false;
    opts.status.include_ignored =
        parser.has_flag("--include-ignored") || cfg_flag("--include-ignored");
    bool no_untracked = parser.has_flag("--no-untracked") || cfg_flag("--no-untracked");
    opts.status.include_untracked = !no_untracked;
    opts.diff.include_untracked = !no_untracked;
    bool no_renames = parser.has_flag("--no-renames") || cfg_flag("--no-renames");
    opts.status.detect_renames = !no_renames;
    opts.diff.detect_renames = !no_renames;
    if (parser.has_flag("--rename-threshold") || cfg_opts.count("--rename-threshold")) {
        std::string val = parser.get_option("--rename-threshold");
        if (val.empty())
            val = cfg_opt("--rename-threshold");
        opts.status.rename_threshold = static_cast<std::uint16_t>(parse_uint(val, 0, 100, ok));
        if (!ok)
            throw std::runtime_error("Invalid value for --rename-threshold");
    }

    opts.staged_only = parser.has_flag("--staged") || cfg_flag("--staged");
    opts.unstaged_only = parser.has_flag("--unstaged") || cfg_flag("--unstaged");
    if (opts.staged_only && opts.unstaged_only)
        throw std::runtime_error("--staged and --unstaged are mutually exclusive");
    opts.stat_only = parser.has_flag("--stat") || cfg_flag("--stat");
    if (parser.has_flag("--ignore-whitespace") || cfg_opts.count("--ignore-whitespace")) {
        std::string val = parser.get_option("--ignore-whitespace");
        if (val.empty())
            val = cfg_opt("--ignore-whitespace");
        opts.diff.whitespace = parse_whitespace_mode(val);
    }
    if (parser.has_flag("--context") || cfg_opts.count("--context")) {
        std::string val = parser.get_option("--context");
        if (val.empty())
            val = cfg_opt("--context");
        opts.diff.context_lines = parse_uint(val, 0, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --context");
    }
}
