/**
 * @file autodeploy.cpp
 * @brief CLI entry point of the continuous deployment agent.
 *
 * Loads the configuration, sets up logging and the instance lock, then hands
 * control to the Syncer which polls the remote until SIGINT or SIGTERM.
 */

#include <csignal>
#include <iostream>

#include "errors.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "lockfile.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "syncer.hpp"
#include "time_utils.hpp"
#include "version.hpp"

namespace {

deploy::Syncer* g_syncer_ptr = nullptr;

void handle_signal(int) {
    if (g_syncer_ptr)
        g_syncer_ptr->request_stop();
}

bool setup_logging(const LoggingOptions& logging) {
    set_console_logging(!logging.silent);
    set_console_colors(!logging.no_colors);
    set_log_level(logging.log_level);
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    if (logging.log_file.empty())
        return true;
    return init_logger(logging.log_file, logging.max_log_size, logging.max_log_files);
}

int run_agent(const Options& opts) {
    const deploy::DeploymentTarget& target = opts.target;
    log_info("Configuration loaded", {{"config", opts.config_file},
                                      {"repoPath", target.repo_path.string()},
                                      {"remoteRepo", target.remote_url},
                                      {"branch", target.branch},
                                      {"interval", format_millis(target.interval)}});

    LockFile lock(lock_path_for(target.repo_path));
    if (!lock.acquired()) {
        log_error(lock.error(), {{"lock", lock.path().string()}});
        return 1;
    }

    deploy::Syncer syncer(target, procutil::process_runner());
    g_syncer_ptr = &syncer;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    int rc = 0;
    try {
        syncer.run(opts.single_run ? 1 : 0);
    } catch (const CommandFailed& e) {
        log_error("Initial clone failed: " + std::string(e.what()),
                  {{"command", e.command_line()}, {"exit_code", std::to_string(e.exit_code())}});
        rc = 1;
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_syncer_ptr = nullptr;
    return rc;
}

} // namespace

/**
 * @brief Application entry point.
 *
 * @return int Zero on graceful shutdown, a finished single run or when
 *             printing help/version; 1 on configuration errors, a held lock
 *             or a failed initial clone.
 */
#ifndef AUTODEPLOY_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    int rc = 0;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0], std::cout);
            return 0;
        }
        if (opts.print_version) {
            std::cout << AUTODEPLOY_VERSION << "\n";
            return 0;
        }
        if (!setup_logging(opts.logging)) {
            set_console_logging(true);
            log_warning("Failed to open log file, logging to console only",
                        {{"path", opts.logging.log_file}});
        } else if (logger_initialized()) {
            log_debug("Writing log file", {{"path", opts.logging.log_file}});
        }
        rc = run_agent(opts);
    } catch (const ConfigError& e) {
        log_error(e.what(), {{"kind", error_kind_name(e.kind())}});
        rc = 1;
    } catch (const std::exception& e) {
        log_error(e.what());
        rc = 1;
    }
    flush_logger();
    shutdown_logger();
    return rc;
}
#endif // AUTODEPLOY_NO_MAIN
