#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "errors.hpp"

namespace procutil {

/**
 * @brief An external program invocation.
 *
 * The program is looked up on `PATH` and receives @ref args verbatim; no
 * shell is involved. An empty @ref cwd runs the child in the current
 * working directory of autodeploy.
 */
struct Command {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path cwd;

    /** `program arg1 arg2 ...` for log messages. */
    std::string to_string() const;
};

/**
 * @brief Raw result of a finished child process.
 */
struct CommandOutput {
    int exit_code = 0; ///< Exit status, or 128 + signal number.
    std::string out;   ///< Everything written to standard output.
    std::string err;   ///< Everything written to standard error.
};

/**
 * @brief Spawn @p cmd and block until it terminates.
 *
 * Standard input of the child is `/dev/null`; standard output and standard
 * error are captured completely. A program that cannot be started is
 * reported as exit code 127 with the reason on `err`.
 *
 * @throws CommandFailed when the pipes or the child process cannot be
 *         created.
 */
CommandOutput execute(const Command& cmd);

/**
 * @brief Run @p cmd and return its trimmed standard output.
 *
 * @throws CommandFailed if the command exits with a nonzero status. The
 *         exception message is the trimmed standard error of the command.
 */
std::string run_command(const Command& cmd);

/** Convenience overload of @ref run_command(const Command&). */
std::string run_command(const std::string& program, const std::vector<std::string>& args,
                        const std::filesystem::path& cwd = {});

/**
 * @brief Blocking command execution hook used by the deployment layers.
 *
 * Must return the trimmed standard output or throw @ref CommandFailed.
 * Tests install scripted implementations; production code uses
 * @ref run_command.
 */
using CommandRunner = std::function<std::string(const Command&)>;

/** Runner that spawns real processes through @ref run_command. */
CommandRunner process_runner();

} // namespace procutil

#endif // COMMAND_RUNNER_HPP
