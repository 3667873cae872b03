#ifndef REPO_STATE_HPP
#define REPO_STATE_HPP

#include <filesystem>

#include "command_runner.hpp"
#include "deployment_target.hpp"

namespace deploy {

/** Outcome of one change check. */
enum class ChangeDecision { RepositoryMissing, ChangesDetected, NoChanges };

const char* change_decision_name(ChangeDecision decision);

/** What currently lives at the configured local path. */
enum class PathState { Absent, Empty, Populated };

/**
 * @brief Classify @p path.
 *
 * Any filesystem error while inspecting the path (permission denied, a
 * dangling component, ...) is reported as `Absent`. A path that exists but
 * is not a directory is `Populated`.
 */
PathState classify_path(const std::filesystem::path& path);

/**
 * @brief `true` when the path needs a fresh clone.
 */
bool is_absent_or_empty(const std::filesystem::path& path);

/**
 * @brief `git clone --branch <branch> <url> <path>`.
 *
 * @throws CommandFailed when git fails.
 */
void clone_repository(const procutil::CommandRunner& run, const DeploymentTarget& target);

/**
 * @brief Decide whether the remote branch differs from the local checkout.
 *
 * Returns `RepositoryMissing` without running anything when the local path
 * does not exist. Otherwise fetches the tracked branch and diffs `HEAD`
 * against `<remote>/<branch>`; a non-empty diff means changes.
 *
 * @throws CommandFailed from the fetch or diff step, unchanged.
 */
ChangeDecision detect_changes(const procutil::CommandRunner& run, const DeploymentTarget& target);

} // namespace deploy

#endif // REPO_STATE_HPP
