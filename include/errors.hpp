#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Category of an autodeploy failure.
 *
 * `RepositoryMissing` is listed for completeness; it is delivered as a
 * @ref deploy::ChangeDecision value and never thrown.
 */
enum class ErrorKind { Config, CommandFailed, RepositoryMissing, DeployFailed };

/**
 * @brief Human readable name of an @ref ErrorKind.
 */
const char* error_kind_name(ErrorKind kind);

/**
 * @brief Base class for all errors raised by autodeploy.
 *
 * Callers that need to react differently per failure type switch on
 * `kind()` instead of inspecting the message.
 */
class AutodeployError : public std::runtime_error {
  public:
    AutodeployError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

/** Missing, unreadable or invalid configuration. Fatal at startup. */
class ConfigError : public AutodeployError {
  public:
    explicit ConfigError(const std::string& message)
        : AutodeployError(ErrorKind::Config, message) {}
};

/**
 * @brief An external command exited with a nonzero status.
 *
 * `what()` is the trimmed standard error of the command (or a short
 * description when it printed nothing).
 */
class CommandFailed : public AutodeployError {
  public:
    CommandFailed(std::string program, std::vector<std::string> args, int exit_code,
                  const std::string& stderr_text);

    const std::string& program() const noexcept { return program_; }
    const std::vector<std::string>& args() const noexcept { return args_; }
    /** Exit status, or 128 + signal number when the child was killed. */
    int exit_code() const noexcept { return exit_code_; }
    /** `program arg1 arg2 ...` for log messages. */
    std::string command_line() const;

  private:
    std::string program_;
    std::vector<std::string> args_;
    int exit_code_;
};

/** A pull, install or build step of a deployment failed. */
class DeployFailed : public AutodeployError {
  public:
    DeployFailed(std::string step, const std::string& reason)
        : AutodeployError(ErrorKind::DeployFailed, step + ": " + reason), step_(std::move(step)) {}

    const std::string& step() const noexcept { return step_; }

  private:
    std::string step_;
};

#endif // ERRORS_HPP
