#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <string>
#include <filesystem>
#include <optional>

/**
 * Read-only repository inspection through libgit2.
 *
 * Every mutating git operation (clone, fetch, diff, pull) goes through the
 * `git` executable; these helpers only answer questions about a local
 * clone for diagnostics and never throw.
 */
namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;

/**
 * @brief Determine whether the given path is a Git work tree.
 *
 * @param p Filesystem path to check.
 * @return `true` if a `.git` directory exists inside @a p.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return 40 character hexadecimal commit hash or `std::nullopt` on error.
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Resolve the remote-tracking branch `refs/remotes/<remote>/<branch>`.
 *
 * No network access: the value is whatever the last fetch recorded.
 *
 * @return Commit hash or `std::nullopt` when the ref does not exist.
 */
std::optional<std::string> get_tracking_hash(const fs::path& repo, const std::string& remote,
                                             const std::string& branch,
                                             std::string* error = nullptr);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Branch name or `std::nullopt` if it cannot be determined (for
 *         example on a detached `HEAD`).
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief First line of the message of commit @p hash.
 */
std::optional<std::string> get_commit_summary(const fs::path& repo, const std::string& hash,
                                              std::string* error = nullptr);

/**
 * @brief Abbreviate a commit hash for log output.
 */
std::string short_hash(const std::string& hash);

} // namespace git

#endif // GIT_UTILS_HPP
