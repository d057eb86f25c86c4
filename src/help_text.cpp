#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--dir", "-C", "<path>", "Repository to inspect (default: current directory)", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"},
        {"--version", "-V", "", "Print the version and exit", "Basics"},
        {"--include-ignored", "", "", "Report ignored files", "Status"},
        {"--no-untracked", "", "", "Skip untracked files", "Status"},
        {"--no-renames", "", "", "Disable rename detection", "Status"},
        {"--rename-threshold", "", "<0-100>", "Similarity needed for a rename (default 50)",
         "Status"},
        {"--staged", "", "", "Diff HEAD against the index only", "Diff"},
        {"--unstaged", "", "", "Diff the index against the working tree only", "Diff"},
        {"--stat", "", "", "Print per-file statistics instead of the patch", "Diff"},
        {"--ignore-whitespace", "", "<none|all|change|eol>",
         "Whitespace handling (default all)", "Diff"},
        {"--context", "", "<n>", "Context lines around each hunk (default 3)", "Diff"},
        {"--limit", "-n", "<n>", "Number of commits to list (default 20)", "List"},
        {"--short", "-s", "", "One line per commit", "List"},
        {"--remote", "", "<name>", "Remote to push to instead of the upstream's", "Remote"},
        {"--force", "-f", "", "Pull over local changes; force-push (still guarded)", "Remote"},
        {"--timeout", "", "<sec>", "Network operation timeout", "Remote"},
        {"--proxy", "", "<url>", "Proxy for fetch and push", "Remote"},
        {"--json", "", "", "Emit JSON instead of text", "Display"},
        {"--no-colors", "", "", "Disable ANSI colors", "Display"},
        {"--color", "", "<ansi>", "Override every color", "Display"},
        {"--theme", "", "<file>", "Load colors from a YAML or JSON theme", "Display"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Load .gitsight.yaml or .gitsight.json if present", "Config"},
        {"--verbose", "-v", "", "Debug logging to stderr", "Logging"},
        {"--log-file", "", "<path>", "Write log to file", "Logging"},
        {"--log-level", "", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log above this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated logs to keep (default 3)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated logs", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility", "Logging"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        width = std::max(width, flag.size());
    }

    std::cout << "gitsight - branch, working tree and rebase state at a glance\n\n";
    std::cout << "Usage: " << prog << " [status] [options] [<pathspec>...]\n";
    std::cout << "       " << prog << " list [options]\n";
    std::cout << "       " << prog << " diff [<base> [<target>]] [options]\n";
    std::cout << "       " << prog << " fetch|pull|push|check [options]\n\n";
    const std::vector<std::string> order{"Basics", "Status",  "Diff",   "List",
                                         "Remote", "Display", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::string flag = "  ";
            if (std::strlen(o->short_flag))
                flag += std::string(o->short_flag) + ", ";
            else
                flag += "    ";
            flag += o->long_flag;
            if (std::strlen(o->arg))
                flag += " " + std::string(o->arg);
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag << o->desc
                      << "\n";
        }
        std::cout << "\n";
    }
    std::cout << "Exit codes: 0 ok, 1 error, 2 not found, 3 unrelated history,\n"
              << "            4 malformed repository state, 5 push rejected\n";
}
