#pragma once
#include <catch2/catch_test_macros.hpp>
#include "command_runner.hpp"
#include "deployment_target.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>

#if !defined(REDIR)
#define REDIR " > /dev/null 2>&1"
#endif

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace autodeploy::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive)
        fs::remove_all(target, ec);
    else
        fs::remove(target, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
    if (remove_once(target, recursive, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
}  // namespace detail

inline void remove_path(const fs::path& target) { detail::remove_with_retry(target, false); }

inline void remove_all(const fs::path& target) { detail::remove_with_retry(target, true); }

/** Fresh scratch directory under the system temp dir, removed on scope exit. */
struct TempDir {
    fs::path path;
    explicit TempDir(const std::string& name)
        : path(fs::temp_directory_path() / (name + "_" + std::to_string(getpid()))) {
        remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

/**
 * Records every command and answers through a handler instead of spawning a
 * process. The default handler succeeds with empty output.
 */
struct ScriptedRunner {
    std::vector<procutil::Command> calls;
    std::function<std::string(const procutil::Command&)> handler;

    procutil::CommandRunner runner() {
        return [this](const procutil::Command& cmd) {
            calls.push_back(cmd);
            return handler ? handler(cmd) : std::string();
        };
    }

    /** Command lines in call order, e.g. `git fetch origin main`. */
    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        for (const auto& c : calls)
            out.push_back(c.to_string());
        return out;
    }

    size_t count(const std::string& subcommand) const {
        size_t n = 0;
        for (const auto& c : calls)
            if (c.program == "git" && !c.args.empty() && c.args.front() == subcommand)
                ++n;
        return n;
    }
};

inline deploy::DeploymentTarget make_target(const fs::path& repo) {
    deploy::DeploymentTarget t;
    t.repo_path = repo;
    t.remote_url = "https://example.invalid/app.git";
    t.branch = "main";
    t.interval = std::chrono::milliseconds(10);
    return t;
}

inline int git_cmd(const fs::path& repo, const std::string& args) {
    return std::system(("git -C " + repo.string() + " " + args + REDIR).c_str());
}

/** Commit @p file with @p content in @p repo and push it to origin/main. */
inline void commit_and_push(const fs::path& repo, const std::string& file,
                            const std::string& content) {
    std::ofstream(repo / file) << content;
    REQUIRE(git_cmd(repo, "add " + file) == 0);
    REQUIRE(git_cmd(repo, "-c user.email=you@example.com -c user.name=tester commit -m update") ==
            0);
    REQUIRE(git_cmd(repo, "push origin HEAD:refs/heads/main") == 0);
}

/** Bare remote with one commit on `main`, seeded through a scratch clone. */
inline void make_remote(const fs::path& remote, const fs::path& seed) {
    REQUIRE(std::system(("git init --bare " + remote.string() + REDIR).c_str()) == 0);
    REQUIRE(std::system(("git clone " + remote.string() + " " + seed.string() + REDIR).c_str()) ==
            0);
    commit_and_push(seed, "README.md", "hello\n");
}
}  // namespace autodeploy::test_support

/** Quiet console for tests that drive the logger indirectly. */
struct QuietLogger {
    QuietLogger() { set_console_logging(false); }
    ~QuietLogger() { shutdown_logger(); }
};

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::autodeploy::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::autodeploy::test_support::remove_all((path))
#endif
