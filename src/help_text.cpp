#include "help_text.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <vector>
#include <map>
#include <cstring>
#include <string>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

struct CommandInfo {
    const char* usage;
    const char* desc;
};

void print_help(const char* prog) {
    static const std::vector<CommandInfo> commands = {
        {"run <repo-path> <prompt>", "Run the agent on a repository and stream its output"},
        {"clone <url>", "Clone a repository into the clone root and register it"},
        {"add <repo-path>", "Register an existing repository"},
        {"scan <dir>...", "List repositories found below the given directories"},
        {"repos", "List registered repositories"},
        {"remove-repo <repo-id>", "Unregister a repository and drop its sessions"},
        {"sessions", "List sessions, most recent first"},
        {"output <session-id>", "Print recorded output of a session"},
        {"delete-session <session-id>", "Delete a session and its output"},
        {"config [<key> [<value>]]", "List, show or set stored settings"}};
    static const std::vector<OptionInfo> opts = {
        {"--data-dir", "", "<path>", "State directory (default ~/.ralphtown)", "Basics"},
        {"--clone-root", "", "<path>", "Clone destination (default ~/ralphtown)", "Basics"},
        {"--agent", "", "<exe>", "Agent executable (default ralph)", "Basics"},
        {"--grace-period-ms", "", "<ms|s|m>", "Wait before killing a cancelled agent", "Basics"},
        {"--git-timeout", "", "<sec>", "Network timeout for clones (0 = libgit2 default)",
         "Basics"},
        {"--reconcile-orphans", "", "", "Mark stale running sessions as error on start",
         "Basics"},
        {"--name", "-n", "<name>", "Name for `add` or the session created by `run`", "Basics"},
        {"--depth", "", "<n>", "Scan depth for `scan` (default 2)", "Basics"},
        {"--after", "", "<id>", "Only output records after this id", "Basics"},
        {"--limit", "", "<n>", "Maximum output records", "Basics"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--webhook-url", "", "<url>", "POST final session status to this URL", "Notify"},
        {"--webhook-secret", "", "<str>", "Sent as X-Webhook-Secret", "Notify"},
        {"--log-file", "-L", "<path>", "Write logs to file", "Logging"},
        {"--log-level", "-l", "<level>", "debug, info, warning or error", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate log after this size", "Logging"},
        {"--log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--json-log", "", "", "Write logs as JSON lines", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated logs", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility", "Logging"},
        {"--version", "-v", "", "Print version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    auto format_flag = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, format_flag(o).size());
    }
    for (const auto& c : commands)
        width = std::max(width, std::strlen(c.usage) + 2);

    std::cout << "ralphtown - run AI agent sessions against git repositories\n";
    std::cout << "Sessions, output and repositories are kept in <data-dir>/state.json.\n\n";
    std::cout << "Usage: " << prog << " <command> [args] [options]\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : commands)
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << c.usage << c.desc
                  << "\n";
    std::cout << "\n";
    const std::vector<std::string> order{"Basics", "Config", "Notify", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat])
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << format_flag(*o)
                      << o->desc << "\n";
        std::cout << "\n";
    }
}
