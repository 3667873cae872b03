#include "deployer.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <vector>

#include "errors.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace deploy {

static procutil::Command make_command(const std::vector<std::string>& argv, const fs::path& cwd) {
    procutil::Command cmd;
    cmd.program = argv.front();
    cmd.args.assign(argv.begin() + 1, argv.end());
    cmd.cwd = cwd;
    return cmd;
}

// Run one step, rethrowing a command failure as DeployFailed for that step.
static void run_step(const procutil::CommandRunner& run, const char* step,
                     const procutil::Command& cmd) {
    try {
        run(cmd);
    } catch (const CommandFailed& e) {
        throw DeployFailed(step, e.what());
    }
}

static void run_deploy_steps(const procutil::CommandRunner& run, const DeploymentTarget& target) {
    log_info("Pulling latest code...");
    run_step(run, "pull", procutil::Command{"git", {"pull"}, target.repo_path});

    std::error_code ec;
    if (!fs::exists(target.repo_path / target.build_file, ec)) {
        log_warning(target.build_file + " not found, skipping dependency install and build");
        return;
    }
    log_info("Found " + target.build_file + ", installing dependencies...");
    run_step(run, "install", make_command(target.install_command, target.repo_path));
    log_info("Building project...");
    run_step(run, "build", make_command(target.build_command, target.repo_path));
    log_success("Build finished");
}

bool deploy(const procutil::CommandRunner& run, const DeploymentTarget& target) noexcept {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return format_millis(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start));
    };
    try {
        run_deploy_steps(run, target);
        std::map<std::string, std::string> fields{{"elapsed", elapsed()}};
        if (auto head = git::get_local_hash(target.repo_path))
            fields["commit"] = git::short_hash(*head);
        log_success("Deployment finished!", fields);
        return true;
    } catch (const DeployFailed& e) {
        log_error(std::string("Deployment failed: ") + e.what(),
                  {{"step", e.step()}, {"elapsed", elapsed()}});
    } catch (const std::exception& e) {
        log_error(std::string("Deployment failed: ") + e.what(), {{"elapsed", elapsed()}});
    }
    return false;
}

} // namespace deploy
