#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

const std::set<std::string>& known_option_flags() {
    static const std::set<std::string> known{"--dir",
                                             "--help",
                                             "--version",
                                             "--json",
                                             "--no-colors",
                                             "--color",
                                             "--theme",
                                             "--short",
                                             "--log-file",
                                             "--log-level",
                                             "--json-log",
                                             "--compress-logs",
                                             "--max-log-size",
                                             "--max-log-files",
                                             "--syslog",
                                             "--syslog-facility",
                                             "--verbose",
                                             "--include-ignored",
                                             "--no-untracked",
                                             "--no-renames",
                                             "--rename-threshold",
                                             "--staged",
                                             "--unstaged",
                                             "--stat",
                                             "--ignore-whitespace",
                                             "--context",
                                             "--limit",
                                             "--remote",
                                             "--force",
                                             "--timeout",
                                             "--proxy",
                                             "--config-yaml",
                                             "--config-json",
                                             "--auto-config"};
    return known;
}

const std::set<std::string>& value_option_flags() {
    static const std::set<std::string> values{"--dir",
                                              "--color",
                                              "--theme",
                                              "--log-file",
                                              "--log-level",
                                              "--max-log-size",
                                              "--max-log-files",
                                              "--syslog-facility",
                                              "--rename-threshold",
                                              "--ignore-whitespace",
                                              "--context",
                                              "--limit",
                                              "--remote",
                                              "--timeout",
                                              "--proxy",
                                              "--config-yaml",
                                              "--config-json"};
    return values;
}

const std::map<char, std::string>& short_option_flags() {
    static const std::map<char, std::string> short_opts{
        {'C', "--dir"},     {'h', "--help"},  {'V', "--version"},     {'v', "--verbose"},
        {'n', "--limit"},   {'f', "--force"}, {'s', "--short"},       {'y', "--config-yaml"},
        {'j', "--config-json"}};
    return short_opts;
}

bool parse_command(const std::string& word, Command& cmd) {
    static const std::map<std::string, Command> commands{
        {"status", Command::Status}, {"list", Command::List}, {"log", Command::List},
        {"diff", Command::Diff},     {"fetch", Command::Fetch}, {"pull", Command::Pull},
        {"push", Command::Push},     {"check", Command::Check}};
    auto it = commands.find(word);
    if (it == commands.end())
        return false;
    cmd = it->second;
    return true;
}

const char* command_name(Command cmd) {
    switch (cmd) {
    case Command::Status:
        return "status";
    case Command::List:
        return "list";
    case Command::Diff:
        return "diff";
    case Command::Fetch:
        return "fetch";
    case Command::Pull:
        return "pull";
    case Command::Push:
        return "push";
    case Command::Check:
        return "check";
    }
    return "status";
}

Options parse_options(int argc, char* argv[]) {
    fs::path config_file;
    std::map<std::string, std::string> cfg_opts;
    load_config_and_auto(argc, argv, cfg_opts, config_file);

    const auto& known = known_option_flags();
    ArgParser parser(argc, argv, known, short_option_flags(), value_option_flags());
    for (const auto& kv : cfg_opts) {
        if (!known.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v == "" || v == "1" || v == "true" || v == "yes";
    };
    auto cfg_opt = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::string();
    };

    Options opts;
    bool ok = false;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");

    std::vector<std::string> positional = parser.positional();
    if (!positional.empty()) {
        if (!parse_command(positional.front(), opts.command))
            throw std::runtime_error("Unknown command: " + positional.front());
        positional.erase(positional.begin());
    }
    opts.args = positional;
    if (opts.command == Command::Diff && opts.args.size() > 2)
        throw std::runtime_error("diff takes at most two revisions");
    if (opts.command != Command::Diff && opts.command != Command::Status && !opts.args.empty())
        throw std::runtime_error(std::string(command_name(opts.command)) +
                                 " takes no arguments: " + opts.args.front());
    if (opts.command == Command::Status)
        opts.status.pathspec = opts.args;

    if (parser.has_flag("--dir") || cfg_opts.count("--dir")) {
        std::string val = parser.get_option("--dir");
        if (val.empty())
            val = cfg_opt("--dir");
        if (val.empty())
            throw std::runtime_error("--dir requires a path");
        opts.repo_dir = val;
    }

    parse_logging_and_display(opts, parser, cfg_flag, cfg_opt, cfg_opts);
    parse_analysis_options(opts, parser, cfg_flag, cfg_opt, cfg_opts);

    if (parser.has_flag("--limit") || cfg_opts.count("--limit")) {
        std::string val = parser.get_option("--limit");
        if (val.empty())
            val = cfg_opt("--limit");
        opts.limit = parse_size_t(val, 1, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --limit");
    }
    if (parser.has_flag("--remote") || cfg_opts.count("--remote")) {
        std::string val = parser.get_option("--remote");
        if (val.empty())
            val = cfg_opt("--remote");
        if (val.empty())
            throw std::runtime_error("--remote requires a name");
        opts.remote = val;
    }
    opts.force = parser.has_flag("--force") || cfg_flag("--force");
    if (parser.has_flag("--timeout") || cfg_opts.count("--timeout")) {
        std::string val = parser.get_option("--timeout");
        if (val.empty())
            val = cfg_opt("--timeout");
        auto dur = parse_duration(val, ok);
        if (!ok || dur.count() < 1 || dur.count() > INT_MAX)
            throw std::runtime_error("Invalid value for --timeout");
        opts.timeout = dur;
    }
    if (parser.has_flag("--proxy") || cfg_opts.count("--proxy")) {
        std::string val = parser.get_option("--proxy");
        if (val.empty())
            val = cfg_opt("--proxy");
        if (val.empty())
            throw std::runtime_error("--proxy requires a URL");
        opts.proxy_url = val;
    }
    opts.auto_config = parser.has_flag("--auto-config") || cfg_flag("--auto-config");
    opts.config_file = config_file;
    return opts;
}
