#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
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

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--config", "-c", "<file>", "Configuration file, YAML or JSON (default config.yaml)",
         "Basics"},
        {"--single-run", "-u", "", "Run one poll cycle and exit", "Basics"},
        {"--log-file", "-l", "<path>", "Also write logs to this file", "Logging"},
        {"--log-level", "", "<level>", "DEBUG, INFO, SUCCESS, WARNING or ERROR", "Logging"},
        {"--json-log", "", "", "Write the log file as JSON lines", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default 3)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--no-colors", "", "", "Disable ANSI colors on the console", "Display"},
        {"--silent", "-s", "", "Disable console output", "Display"},
        {"--version", "-v", "", "Print program version and exit", "Display"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "autodeploy - Continuous deployment agent\n";
    os << "Polls a git remote and pulls, installs and builds when the branch changes.\n";
    os << "Configuration keys: repoPath, remoteRepo, interval, branch.\n\n";
    os << "Usage: " << prog << " [--config <file>] [options]\n\n";
    const std::vector<std::string> order{"Basics", "Logging", "Display"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
               << o->desc << "\n";
        os << "\n";
    }
}
