#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
};

struct Options {
    bool show_help = false;
    bool print_version = false;

    /// Subcommand (`run`, `clone`, `add`, ...) and its positional arguments.
    std::string command;
    std::vector<std::string> args;

    std::filesystem::path data_dir;
    std::filesystem::path clone_root;
    std::string agent = "ralph";
    std::chrono::milliseconds grace_period{5000};
    unsigned int git_timeout = 0; ///< seconds, 0 keeps the libgit2 default
    bool reconcile_orphans = false;

    std::string webhook_url;
    std::optional<std::string> webhook_secret;

    LoggingOptions logging;

    std::optional<std::string> name; ///< --name for `add` and `run`
    size_t scan_depth = 2;
    int64_t after_id = 0;
    size_t limit = 0;
    std::filesystem::path config_file;
};

/**
 * @brief Read a config file named by `--config-yaml`/`--config-json`.
 *
 * @return flattened `--key` -> value map, empty when no file was given.
 * Throws `std::runtime_error` if the file cannot be loaded.
 */
std::map<std::string, std::string> load_config_file(int argc, char* argv[],
                                                    std::filesystem::path& config_file);

/**
 * @brief Parse command line and config file into Options.
 *
 * Command-line values override config values. Throws `std::runtime_error`
 * describing the first invalid value or unknown flag.
 */
Options parse_options(int argc, char* argv[]);

#endif // OPTIONS_HPP
