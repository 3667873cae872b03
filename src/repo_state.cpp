#include "repo_state.hpp"

#include <map>
#include <system_error>

#include "git_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace deploy {

const char* change_decision_name(ChangeDecision decision) {
    switch (decision) {
    case ChangeDecision::RepositoryMissing:
        return "repository-missing";
    case ChangeDecision::ChangesDetected:
        return "changes-detected";
    case ChangeDecision::NoChanges:
        return "no-changes";
    }
    return "unknown";
}

PathState classify_path(const fs::path& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec || !fs::exists(st))
        return PathState::Absent;
    if (!fs::is_directory(st))
        return PathState::Populated;
    fs::directory_iterator it(path, ec);
    if (ec)
        return PathState::Absent;
    return it == fs::directory_iterator() ? PathState::Empty : PathState::Populated;
}

bool is_absent_or_empty(const fs::path& path) { return classify_path(path) != PathState::Populated; }

void clone_repository(const procutil::CommandRunner& run, const DeploymentTarget& target) {
    log_info("Cloning remote repository...",
             {{"url", target.remote_url}, {"branch", target.branch}});
    run({"git",
         {"clone", "--branch", target.branch, target.remote_url, target.repo_path.string()},
         {}});
    log_success("Clone finished", {{"path", target.repo_path.string()}});
}

// Diagnostics only: the decision itself comes from git diff.
static void describe_incoming(const DeploymentTarget& target) {
    std::string err;
    auto local = git::get_local_hash(target.repo_path, &err);
    auto remote = git::get_tracking_hash(target.repo_path, target.remote_name, target.branch, &err);
    if (!local || !remote) {
        log_debug("Cannot resolve commits for change summary", {{"error", err}});
        return;
    }
    std::map<std::string, std::string> fields{{"local", git::short_hash(*local)},
                                              {"remote", git::short_hash(*remote)}};
    if (auto summary = git::get_commit_summary(target.repo_path, *remote, &err))
        fields["summary"] = *summary;
    log_info("Incoming revision", fields);
}

ChangeDecision detect_changes(const procutil::CommandRunner& run, const DeploymentTarget& target) {
    log_info("Fetching latest code...", {{"ref", target.tracking_ref()}});
    std::error_code ec;
    if (!fs::exists(target.repo_path, ec)) {
        log_error("Repository path does not exist", {{"path", target.repo_path.string()}});
        return ChangeDecision::RepositoryMissing;
    }

    run({"git", {"fetch", target.remote_name, target.branch}, target.repo_path});
    std::string diff = run({"git", {"diff", "HEAD", target.tracking_ref()}, target.repo_path});
    if (!diff.empty()) {
        log_info("Repository changes detected");
        describe_incoming(target);
        return ChangeDecision::ChangesDetected;
    }
    log_info("No repository changes");
    return ChangeDecision::NoChanges;
}

} // namespace deploy
