#include <map>
#include <set>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

static std::vector<std::string> command_value(const ConfigValues& cfg, const std::string& key,
                                              const std::vector<std::string>& fallback) {
    std::vector<std::string> cmd;
    auto lit = cfg.lists.find(key);
    if (lit != cfg.lists.end())
        cmd = lit->second;
    auto sit = cfg.scalars.find(key);
    if (sit != cfg.scalars.end())
        cmd = split_command(sit->second);
    if (lit == cfg.lists.end() && sit == cfg.scalars.end())
        return fallback;
    if (cmd.empty())
        throw ConfigError("Configuration field '" + key + "' must not be empty");
    return cmd;
}

deploy::DeploymentTarget target_from_config(const ConfigValues& cfg) {
    static const char* required[] = {"repoPath", "remoteRepo", "interval", "branch"};
    std::string missing;
    for (const char* key : required) {
        auto it = cfg.scalars.find(key);
        if (it == cfg.scalars.end() || it->second.empty())
            missing += missing.empty() ? key : std::string(", ") + key;
    }
    if (!missing.empty())
        throw ConfigError("Configuration is missing required field(s): " + missing);

    deploy::DeploymentTarget t;
    t.repo_path = cfg.scalars.at("repoPath");
    t.remote_url = cfg.scalars.at("remoteRepo");
    t.branch = cfg.scalars.at("branch");
    bool ok = false;
    t.interval = parse_time_ms(cfg.scalars.at("interval"), ok);
    if (!ok || t.interval.count() <= 0)
        throw ConfigError("Invalid value for interval: '" + cfg.scalars.at("interval") +
                          "' (expected a positive number of milliseconds)");
    if (t.interval > deploy::kMaxInterval)
        throw ConfigError("Invalid value for interval: '" + cfg.scalars.at("interval") +
                          "' (must not exceed 365 days)");

    auto opt = [&](const std::string& key, std::string& into) {
        auto it = cfg.scalars.find(key);
        if (it == cfg.scalars.end())
            return;
        if (it->second.empty())
            throw ConfigError("Configuration field '" + key + "' must not be empty");
        into = it->second;
    };
    opt("remote", t.remote_name);
    opt("buildFile", t.build_file);
    t.install_command = command_value(cfg, "installCommand", t.install_command);
    t.build_command = command_value(cfg, "buildCommand", t.build_command);
    return t;
}

static void apply_logging_config(const ConfigValues& cfg, LoggingOptions& logging) {
    auto it = cfg.scalars.find("logFile");
    if (it != cfg.scalars.end())
        logging.log_file = it->second;
    it = cfg.scalars.find("logLevel");
    if (it != cfg.scalars.end()) {
        bool ok = false;
        logging.log_level = parse_log_level(it->second, ok);
        if (!ok)
            throw ConfigError("Invalid value for logLevel: '" + it->second + "'");
    }
}

Options parse_options(int argc, char* argv[]) {
    const std::set<std::string> known{"--config",        "--log-file",    "--log-level",
                                      "--json-log",      "--max-log-size", "--max-log-files",
                                      "--compress-logs", "--no-colors",   "--single-run",
                                      "--silent",        "--help",        "--version"};
    const std::set<std::string> with_value{"--config", "--log-file", "--log-level",
                                           "--max-log-size", "--max-log-files"};
    const std::map<char, std::string> short_map{{'c', "--config"},     {'l', "--log-file"},
                                                {'u', "--single-run"}, {'s', "--silent"},
                                                {'h', "--help"},       {'v', "--version"}};
    ArgParser parser(argc, argv, known, with_value, short_map);
    if (!parser.unknown_flags().empty())
        throw ConfigError("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw ConfigError(parser.missing_values().front() + " requires a value");
    if (!parser.positional().empty())
        throw ConfigError("Unexpected argument: " + parser.positional().front());

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    if (parser.has_flag("--config"))
        opts.config_file = parser.get_option("--config");
    if (opts.config_file.empty())
        throw ConfigError("--config requires a file");
    ConfigValues cfg;
    std::string err;
    if (!load_config_file(opts.config_file, cfg, err))
        throw ConfigError("Failed to load config " + opts.config_file + ": " + err);
    opts.target = target_from_config(cfg);
    apply_logging_config(cfg, opts.logging);

    bool ok = false;
    if (parser.has_flag("--log-file"))
        opts.logging.log_file = parser.get_option("--log-file");
    if (parser.has_flag("--log-level")) {
        opts.logging.log_level = parse_log_level(parser.get_option("--log-level"), ok);
        if (!ok)
            throw ConfigError("Invalid value for --log-level");
    }
    if (parser.has_flag("--max-log-size")) {
        opts.logging.max_log_size = parse_bytes(parser, "--max-log-size", ok);
        if (!ok)
            throw ConfigError("Invalid value for --max-log-size");
    }
    if (parser.has_flag("--max-log-files")) {
        opts.logging.max_log_files = parse_uint(parser, "--max-log-files", 1, 100, ok);
        if (!ok)
            throw ConfigError("Invalid value for --max-log-files");
    }
    opts.logging.json_log = parser.has_flag("--json-log");
    opts.logging.compress_logs = parser.has_flag("--compress-logs");
    opts.logging.no_colors = parser.has_flag("--no-colors");
    opts.logging.silent = parser.has_flag("--silent");
    opts.single_run = parser.has_flag("--single-run");
    return opts;
}
