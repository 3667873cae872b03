#include "errors.hpp"

#include <utility>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Config:
        return "ConfigError";
    case ErrorKind::CommandFailed:
        return "CommandFailed";
    case ErrorKind::RepositoryMissing:
        return "RepositoryMissing";
    case ErrorKind::DeployFailed:
        return "DeployFailed";
    }
    return "Unknown";
}

static std::string describe_failure(const std::string& program, int exit_code,
                                    const std::string& stderr_text) {
    if (!stderr_text.empty())
        return stderr_text;
    return program + " exited with status " + std::to_string(exit_code);
}

CommandFailed::CommandFailed(std::string program, std::vector<std::string> args, int exit_code,
                             const std::string& stderr_text)
    : AutodeployError(ErrorKind::CommandFailed,
                      describe_failure(program, exit_code, stderr_text)),
      program_(std::move(program)), args_(std::move(args)), exit_code_(exit_code) {}

std::string CommandFailed::command_line() const {
    std::string out = program_;
    for (const auto& a : args_)
        out += " " + a;
    return out;
}
