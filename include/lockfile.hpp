#ifndef LOCKFILE_HPP
#define LOCKFILE_HPP
#include <filesystem>
#include <string>

/**
 * @brief Lock directory guarding a deployment target.
 *
 * The lock lives beside the checkout, never inside it, so that an empty
 * target directory stays empty for the initial clone.
 *
 * @param repo_path Local clone path from the configuration.
 * @return `<parent>/.<name>.autodeploy-lock`
 */
std::filesystem::path lock_path_for(const std::filesystem::path& repo_path);

/** RAII class that creates a lock directory holding the owner's PID to
 *  prevent two agents from deploying the same checkout. A lock left by a
 *  process that is no longer running is taken over. */
class LockFile {
  public:
    explicit LockFile(const std::filesystem::path& lock_dir);
    ~LockFile();
    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;
    bool acquired() const;
    const std::string& error() const;
    const std::filesystem::path& path() const { return lock_dir_; }

  private:
    std::filesystem::path lock_dir_;
    bool locked_ = false;
    std::string err_;
};

#endif // LOCKFILE_HPP
