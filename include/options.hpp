#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <string>
#include "config_utils.hpp"
#include "deployment_target.hpp"
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
    bool no_colors = false;
    bool silent = false; ///< No console output; the log file still receives entries.
};

struct Options {
    std::string config_file = "config.yaml";
    deploy::DeploymentTarget target;
    LoggingOptions logging;
    bool single_run = false;
    bool show_help = false;
    bool print_version = false;
};

/**
 * @brief Build the deployment target from loaded configuration values.
 *
 * `repoPath`, `remoteRepo`, `interval` and `branch` are required; an empty
 * value counts as missing. `interval` must be a positive number of
 * milliseconds (optionally with an `ms`, `s` or `m` suffix).
 *
 * @throws ConfigError naming every missing field, or the invalid one.
 */
deploy::DeploymentTarget target_from_config(const ConfigValues& cfg);

/**
 * @brief Parse the command line and load the configuration file it names.
 *
 * With `--help` or `--version` the configuration file is not read.
 *
 * @throws ConfigError for unknown flags, invalid values, an unreadable
 *         configuration file or missing required fields.
 */
Options parse_options(int argc, char* argv[]);

#endif // OPTIONS_HPP
