// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <algorithm>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

static void load_config_file(const fs::path& path, std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool loaded = path.extension() == ".json"
                      ? load_json_config(path.string(), cfg_opts, err)
                      : load_yaml_config(path.string(), cfg_opts, err);
    if (!loaded)
        throw std::runtime_error("Failed to load config " + path.string() + ": " + err);
}

void load_config_and_auto(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                          fs::path& config_file) {
    // Pre-parse with the full tables so values of other flags are not taken
    // for positionals; unknown flags are reported by the main parse.
    ArgParser pre_parser(argc, argv, known_option_flags(), short_option_flags(),
                         value_option_flags());
    if (pre_parser.has_flag("--config-yaml")) {
        std::string cfg = pre_parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string cfg = pre_parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }

    auto cfg_flag_pre = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v == "" || v == "1" || v == "true" || v == "yes";
    };
    bool want_auto = pre_parser.has_flag("--auto-config") || cfg_flag_pre("--auto-config");
    if (!want_auto)
        return;

    fs::path dir_hint;
    if (pre_parser.has_flag("--dir"))
        dir_hint = pre_parser.get_option("--dir");
    else if (cfg_opts.count("--dir"))
        dir_hint = cfg_opts["--dir"];

    auto find_cfg = [](const fs::path& dir) -> fs::path {
        if (dir.empty())
            return {};
        std::error_code ec;
        fs::path y = dir / ".gitsight.yaml";
        if (fs::exists(y, ec))
            return y;
        fs::path j = dir / ".gitsight.json";
        if (fs::exists(j, ec))
            return j;
        return {};
    };
    fs::path cfg_path = find_cfg(dir_hint);
    if (cfg_path.empty())
        cfg_path = find_cfg(fs::current_path());
    if (cfg_path.empty())
        return;

    // Explicitly loaded files and the command line win over discovered ones.
    std::map<std::string, std::string> discovered;
    load_config_file(cfg_path, discovered);
    for (const auto& kv : discovered)
        cfg_opts.emplace(kv.first, kv.second);
    if (config_file.empty())
        config_file = cfg_path;
}
