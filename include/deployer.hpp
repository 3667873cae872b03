#ifndef DEPLOYER_HPP
#define DEPLOYER_HPP

#include "command_runner.hpp"
#include "deployment_target.hpp"

namespace deploy {

/**
 * @brief Pull the latest commits and rebuild the checkout.
 *
 * Runs `git pull` in the repository, then, when the build descriptor exists
 * at the repository root, the install and build commands. A missing build
 * descriptor skips both steps and still counts as success.
 *
 * Never throws: every failure is logged as a `DeployFailed` error and
 * reported through the return value.
 *
 * @return `true` if every step succeeded.
 */
bool deploy(const procutil::CommandRunner& run, const DeploymentTarget& target) noexcept;

} // namespace deploy

#endif // DEPLOYER_HPP
