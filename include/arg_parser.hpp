#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (`--flag`, `--opt value` or
 * `--opt=value`) and short options mapped to their long counterparts
 * (`-v`, `-n 5`, `-n5`, or clusters such as `-fv`). Only flags listed in
 * @a value_flags consume a value, so a boolean flag never swallows the
 * positional argument after it. Everything after a bare `--` is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< Store all values for repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::vector<std::string> missing_values_; ///< Value flags given without a value
    std::set<std::string> known_flags_;      ///< List of accepted flags
    std::set<std::string> value_flags_;      ///< Flags that take a value
    std::map<char, std::string> short_map_;  ///< Mapping of short to long flags

    bool accept(const std::string& key) {
        if (known_flags_.empty() || known_flags_.count(key))
            return true;
        unknown_flags_.push_back(key);
        return false;
    }

    void set_flag(const std::string& key) {
        if (accept(key))
            flags_.insert(key);
    }

    void set_option(const std::string& key, const std::string& val) {
        if (!accept(key))
            return;
        flags_.insert(key);
        options_[key] = val;
        multi_options_[key].push_back(val);
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Optional set of flags that are considered valid. If
     *        empty, all flags are treated as known.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     * @param value_flags Flags whose next argument is their value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    set_option(arg.substr(0, eq), arg.substr(eq + 1));
                } else if (value_flags_.count(arg)) {
                    if (i + 1 < argc)
                        set_option(arg, argv[++i]);
                    else
                        missing_values_.push_back(arg);
                } else {
                    set_flag(arg);
                }
            } else if (arg.size() >= 2 && arg[0] == '-') {
                for (size_t j = 1; j < arg.size(); ++j) {
                    char c = arg[j];
                    auto it = short_map_.find(c);
                    if (it == short_map_.end()) {
                        unknown_flags_.push_back(std::string("-") + c);
                        break;
                    }
                    const std::string& key = it->second;
                    if (!value_flags_.count(key)) {
                        set_flag(key);
                        continue;
                    }
                    std::string rest = arg.substr(j + 1);
                    if (!rest.empty() && rest[0] == '=')
                        rest = rest.substr(1);
                    if (!rest.empty())
                        set_option(key, rest);
                    else if (i + 1 < argc)
                        set_option(key, argv[++i]);
                    else
                        missing_values_.push_back(key);
                    break;
                }
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /**
     * @brief Retrieve all values associated with an option.
     *
     * If the option was not provided, an empty vector is returned.
     */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value flags that ended the command line without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
