/**
 * @file ralphtown.cpp
 * @brief CLI entry point for running agent sessions against repositories.
 *
 * Wires option parsing, logging and libgit2 setup, then hands the requested
 * subcommand to the cli module.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

static void setup_logging(const LoggingOptions& log) {
    set_json_logging(log.json_log);
    set_log_compression(log.compress_logs);
    if (!log.log_file.empty())
        init_logger(log.log_file, log.log_level, log.max_log_size, log.log_files);
    else
        set_log_level(log.log_level);
    if (log.use_syslog)
        init_syslog(log.syslog_facility);
}

/**
 * @brief Application entry point.
 *
 * @return int Zero on success or when printing help/version; the command's
 *             exit code otherwise; 1 on invalid options or unexpected errors.
 */
#ifndef RALPHTOWN_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    int rc = 1;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << RALPHTOWN_VERSION << "\n";
            return 0;
        }
        setup_logging(opts.logging);
        git::set_libgit_timeout(opts.git_timeout);
        cli::install_signal_handlers();
        rc = cli::execute(opts, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        rc = 1;
    }
    shutdown_logger();
    return rc;
}
#endif // RALPHTOWN_NO_MAIN
