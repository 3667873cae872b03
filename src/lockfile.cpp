#include "lockfile.hpp"
#include <cerrno>
#include <fstream>
#include <system_error>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool process_running(int pid) {
    if (pid <= 0)
        return false;
    return kill(pid, 0) == 0 || errno != ESRCH;
}

} // namespace

fs::path lock_path_for(const fs::path& repo_path) {
    std::error_code ec;
    fs::path p = fs::absolute(repo_path, ec);
    if (ec)
        p = repo_path;
    p = p.lexically_normal();
    if (p.filename().empty())
        p = p.parent_path();
    return p.parent_path() / ("." + p.filename().string() + ".autodeploy-lock");
}

LockFile::LockFile(const fs::path& lock_dir) : lock_dir_(lock_dir) {
    std::error_code ec;
    if (fs::exists(lock_dir_, ec)) {
        std::ifstream f(lock_dir_ / "pid");
        int pid = 0;
        if (f)
            f >> pid;
        if (pid != 0 && process_running(pid)) {
            err_ = "Another instance is already running (PID " + std::to_string(pid) + ")";
            return;
        }
        fs::remove_all(lock_dir_, ec);
        if (ec) {
            err_ = "Failed to remove stale lock " + lock_dir_.string() + ": " + ec.message();
            return;
        }
    }
    // git clone creates missing leading directories; the lock has to as well.
    const fs::path parent = lock_dir_.parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            err_ = "Failed to create " + parent.string() + ": " + ec.message();
            return;
        }
    }
    if (!fs::create_directory(lock_dir_, ec)) {
        err_ = "Failed to create lock directory " + lock_dir_.string();
        if (ec)
            err_ += ": " + ec.message();
        return;
    }
    std::ofstream out(lock_dir_ / "pid");
    out << getpid();
    if (!out) {
        err_ = "Failed to write " + (lock_dir_ / "pid").string();
        fs::remove_all(lock_dir_, ec);
        return;
    }
    locked_ = true;
}

LockFile::~LockFile() {
    if (locked_) {
        std::error_code ec;
        fs::remove_all(lock_dir_, ec);
    }
}

bool LockFile::acquired() const { return locked_; }
const std::string& LockFile::error() const { return err_; }
