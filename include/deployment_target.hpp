#ifndef DEPLOYMENT_TARGET_HPP
#define DEPLOYMENT_TARGET_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace deploy {

/** Longest accepted poll interval. */
constexpr std::chrono::milliseconds kMaxInterval = std::chrono::hours(24 * 365);

/**
 * @brief The single repository autodeploy keeps in sync.
 *
 * Built once from the configuration file and never modified afterwards.
 */
struct DeploymentTarget {
    std::filesystem::path repo_path;        ///< Local clone.
    std::string remote_url;                 ///< URL used when cloning.
    std::string branch;                     ///< Branch to clone and track.
    std::chrono::milliseconds interval{0};  ///< Delay between poll cycles.
    std::string remote_name = "origin";     ///< Remote fetched from.
    std::string build_file = "package.json"; ///< Build descriptor gating install/build.
    std::vector<std::string> install_command{"npm", "install"};
    std::vector<std::string> build_command{"npm", "run", "build"};

    /** `<remote>/<branch>`, the ref compared against `HEAD`. */
    std::string tracking_ref() const { return remote_name + "/" + branch; }
};

} // namespace deploy

#endif // DEPLOYMENT_TARGET_HPP
