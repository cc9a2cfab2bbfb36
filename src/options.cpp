#include <climits>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

std::map<std::string, std::string> load_config_file(int argc, char* argv[],
                                                    fs::path& config_file) {
    std::map<std::string, std::string> cfg_opts;
    const std::set<std::string> pre_known{"--config-yaml", "--config-json"};
    const std::map<char, std::string> pre_short{{'y', "--config-yaml"}, {'j', "--config-json"}};
    ArgParser pre_parser(argc, argv, pre_known, pre_short);
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
    return cfg_opts;
}

Options parse_options(int argc, char* argv[]) {
    Options opts;
    std::map<std::string, std::string> cfg_opts = load_config_file(argc, argv, opts.config_file);

    const std::set<std::string> known{
        "--help",         "--version",          "--config-yaml",    "--config-json",
        "--data-dir",     "--clone-root",       "--agent",          "--grace-period-ms",
        "--log-file",     "--log-level",        "--max-log-size",   "--log-files",
        "--json-log",     "--compress-logs",    "--syslog",         "--syslog-facility",
        "--webhook-url",  "--webhook-secret",   "--reconcile-orphans", "--name",
        "--depth",        "--after",            "--limit",          "--git-timeout"};
    const std::set<std::string> switches{"--help",          "--version", "--json-log",
                                         "--compress-logs", "--syslog",  "--reconcile-orphans"};
    const std::map<char, std::string> short_opts{{'h', "--help"},        {'v', "--version"},
                                                 {'y', "--config-yaml"}, {'j', "--config-json"},
                                                 {'n', "--name"},        {'L', "--log-file"},
                                                 {'l', "--log-level"}};
    ArgParser parser(argc, argv, known, short_opts, switches);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());

    // Command line wins over the config file.
    auto has = [&](const std::string& k) { return parser.has_flag(k) || cfg_opts.count(k) > 0; };
    auto value = [&](const std::string& k) -> std::string {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        return it == cfg_opts.end() ? std::string() : it->second;
    };
    auto flag = [&](const std::string& k) {
        if (parser.has_flag(k))
            return true;
        auto it = cfg_opts.find(k);
        return it != cfg_opts.end() && parse_bool(it->second);
    };
    auto required = [&](const std::string& k) {
        std::string v = value(k);
        if (v.empty())
            throw std::runtime_error(k + " requires a value");
        return v;
    };

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (!parser.positional().empty()) {
        opts.command = parser.positional().front();
        opts.args.assign(parser.positional().begin() + 1, parser.positional().end());
    }

    const std::string home = procutil::home_directory();
    if (has("--data-dir"))
        opts.data_dir = required("--data-dir");
    else if (!home.empty())
        opts.data_dir = fs::path(home) / ".ralphtown";
    if (has("--clone-root"))
        opts.clone_root = required("--clone-root");
    else if (!home.empty())
        opts.clone_root = fs::path(home) / "ralphtown";
    if (has("--agent"))
        opts.agent = required("--agent");

    bool ok = false;
    if (has("--grace-period-ms")) {
        opts.grace_period = parse_time_ms(value("--grace-period-ms"), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --grace-period-ms");
    }
    if (has("--git-timeout")) {
        opts.git_timeout =
            static_cast<unsigned int>(parse_size_t(value("--git-timeout"), 0, 3600, ok));
        if (!ok)
            throw std::runtime_error("Invalid value for --git-timeout");
    }
    opts.reconcile_orphans = flag("--reconcile-orphans");

    if (has("--webhook-url"))
        opts.webhook_url = required("--webhook-url");
    if (has("--webhook-secret"))
        opts.webhook_secret = required("--webhook-secret");

    LoggingOptions& log = opts.logging;
    if (has("--log-file"))
        log.log_file = required("--log-file");
    if (has("--log-level") && !parse_log_level(value("--log-level"), log.log_level))
        throw std::runtime_error("Invalid value for --log-level: " + value("--log-level"));
    if (has("--max-log-size")) {
        log.max_log_size = parse_bytes(value("--max-log-size"), 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (has("--log-files")) {
        log.log_files = parse_size_t(value("--log-files"), 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --log-files");
    }
    log.json_log = flag("--json-log");
    log.compress_logs = flag("--compress-logs");
    log.use_syslog = flag("--syslog");
    if (has("--syslog-facility")) {
        log.syslog_facility =
            static_cast<int>(parse_size_t(value("--syslog-facility"), 0, INT_MAX, ok));
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility");
    }

    if (parser.has_flag("--name"))
        opts.name = required("--name");
    if (parser.has_flag("--depth")) {
        opts.scan_depth = parse_size_t(parser.get_option("--depth"), 0, 64, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --depth");
    }
    if (parser.has_flag("--after")) {
        opts.after_id = parse_int64(parser.get_option("--after"), 0, INT64_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --after");
    }
    if (parser.has_flag("--limit")) {
        opts.limit = parse_size_t(parser.get_option("--limit"), 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --limit");
    }
    return opts;
}
