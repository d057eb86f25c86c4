#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // Scalars are kept as written; yaml-cpp spells booleans several ways.
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        out = b ? "true" : "false";
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static bool store_yaml_value(const std::string& key, const YAML::Node& val,
                             std::map<std::string, std::string>& opts, std::string& error) {
    std::string s;
    if (!to_string_value(val, s)) {
        error = "Unsupported value for key '" + key + "'";
        return false;
    }
    opts["--" + key] = s;
    return true;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (node.IsMap()) {
                for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                    if (!it2->first.IsScalar())
                        continue;
                    if (!store_yaml_value(it2->first.as<std::string>(), it2->second, opts, error))
                        return false;
                }
            } else if (!store_yaml_value(key_name, node, opts, error)) {
                return false;
            }
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

static bool store_json_value(const std::string& key, const nlohmann::json& val,
                             std::map<std::string, std::string>& opts, std::string& error) {
    std::string s;
    if (!to_string_value(val, s)) {
        error = "Unsupported value for key '" + key + "'";
        return false;
    }
    opts["--" + key] = s;
    return true;
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    if (!store_json_value(sub.key(), sub.value(), opts, error))
                        return false;
                }
            } else if (!store_json_value(it.key(), val, opts, error)) {
                return false;
            }
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}

static bool assign_theme_field(const std::string& key, const std::string& val,
                               gitsight::Theme& theme) {
    if (key == "reset")
        theme.reset = val;
    else if (key == "green")
        theme.green = val;
    else if (key == "yellow")
        theme.yellow = val;
    else if (key == "red")
        theme.red = val;
    else if (key == "cyan")
        theme.cyan = val;
    else if (key == "blue")
        theme.blue = val;
    else if (key == "gray")
        theme.gray = val;
    else if (key == "bold")
        theme.bold = val;
    else if (key == "magenta")
        theme.magenta = val;
    else
        return false;
    return true;
}

bool load_theme(const std::string& path, gitsight::Theme& theme, std::string& error) {
    std::string ext;
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos)
        ext = path.substr(pos + 1);
    for (auto& c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    if (ext == "json") {
        try {
            nlohmann::json root;
            ifs >> root;
            if (!root.is_object()) {
                error = "Root JSON value is not an object";
                return false;
            }
            for (auto it = root.begin(); it != root.end(); ++it) {
                if (!it.value().is_string() ||
                    !assign_theme_field(it.key(), it.value().get<std::string>(), theme)) {
                    error = "Unknown theme color '" + it.key() + "'";
                    return false;
                }
            }
            return true;
        } catch (const nlohmann::json::exception& e) {
            error = e.what();
            return false;
        }
    }
    try {
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar() || !it->second.IsScalar() ||
                !assign_theme_field(it->first.as<std::string>(), it->second.as<std::string>(),
                                    theme)) {
                error = "Unknown theme color '" + it->first.Scalar() + "'";
                return false;
            }
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}
