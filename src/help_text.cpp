#include "help_text.hpp"
#include "tui.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <vector>

namespace {

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

const std::vector<OptionInfo>& option_table() {
    static const std::vector<OptionInfo> opts = {
        {"--root", "-o", "<path>", "Directory searched for repositories (repeatable)", "Discovery"},
        {"--repo", "", "<path>", "Add a repository explicitly (repeatable)", "Discovery"},
        {"--recursive", "-e", "", "Search below the first directory level", "Discovery"},
        {"--max-depth", "-D", "<n>", "Search depth (default 5 recursive, 1 otherwise)",
         "Discovery"},
        {"--ignore", "-I", "<pattern>", "Skip matching directories (repeatable)", "Discovery"},
        {"--ignore-file", "", "<file>", "Read ignore patterns from a file", "Discovery"},
        {"--sort", "", "<name|path|none>", "Order of the repository list", "Discovery"},
        {"--concurrency", "-n", "<n>", "Parallel git operations (0 = auto, max 8)", "Operations"},
        {"--refresh-timeout", "", "<N[s|m|h]>", "Deadline for status refreshes (default 30s, max 7d)",
         "Operations"},
        {"--op-timeout", "", "<N[s|m|h]>", "Deadline for fetch/pull/push/sync (default 2m, max 7d)",
         "Operations"},
        {"--auto-refresh", "", "<N[s|m|h]>", "Refresh every repository periodically (max 7d)",
         "Operations"},
        {"--no-initial-refresh", "", "", "Do not refresh on start", "Operations"},
        {"--git", "", "<program>", "Git executable (default git)", "Operations"},
        {"--list", "", "", "Refresh once, print one line per repository and exit", "Operations"},
        {"--tick", "", "<ms|s>", "Screen update interval (default 250ms)", "Display"},
        {"--no-colors", "-C", "", "Disable ANSI colors", "Display"},
        {"--color", "", "<ansi>", "Override the color of every status", "Display"},
        {"--theme", "", "<file>", "Load colors from a JSON or YAML theme", "Display"},
        {"--censor-names", "", "", "Mask repository names", "Display"},
        {"--censor-char", "", "<c>", "Character used by --censor-names", "Display"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Look for .gitfleet.yaml or .gitfleet.json", "Config"},
        {"--log-file", "-l", "<file>", "Write log messages to a file", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-g", "", "Same as --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file at this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files kept (default 1)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Also log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility code", "Logging"},
        {"--help", "-h", "", "Show this message", "Basics"},
        {"--version", "-V", "", "Print the version and exit", "Basics"},
    };
    return opts;
}

} // namespace

std::string help_text(const char* prog) {
    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : option_table()) {
        groups[o.category].push_back(&o);
        std::string flag = std::string("  ") + "    " + o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        width = std::max(width, flag.size());
    }

    std::ostringstream os;
    os << "gitfleet - Terminal manager for a fleet of local Git repositories\n";
    os << "Shows the state of every repository and runs git operations on many at once.\n\n";
    os << "Usage: " << prog << " [root-folder...] [options]\n";
    os << "       " << prog << " --repo <path> [--repo <path>...] [options]\n\n";
    const std::vector<std::string> order{"Basics",  "Discovery", "Operations",
                                         "Display", "Config",    "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::string flag = "  ";
            if (std::strlen(o->short_flag))
                flag += std::string(o->short_flag) + ", ";
            else
                flag += "    ";
            flag += o->long_flag;
            if (std::strlen(o->arg))
                flag += " " + std::string(o->arg);
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag << o->desc << "\n";
        }
        os << "\n";
    }
    for (const auto& line : help_overlay_lines())
        os << line << "\n";
    return os.str();
}

void print_help(const char* prog) { std::cout << help_text(prog); }
