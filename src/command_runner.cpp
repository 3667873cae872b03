#include "command_runner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logger.hpp"
#include "system_utils.hpp"

namespace procutil {

std::string Command::to_string() const {
    std::string out = program;
    for (const auto& a : args)
        out += " " + a;
    return out;
}

[[noreturn]] static void spawn_failed(const Command& cmd, const char* what) {
    std::string reason = std::string(what) + ": " + std::strerror(errno);
    throw CommandFailed(cmd.program, cmd.args, -1, reason);
}

// Only async-signal-safe calls between fork() and exec().
[[noreturn]] static void child_fail(const char* what, const char* detail) {
    const char* reason = std::strerror(errno);
    auto put = [](const char* s) {
        ssize_t r = write(STDERR_FILENO, s, std::strlen(s));
        (void)r;
    };
    put(what);
    put(detail);
    put(": ");
    put(reason);
    put("\n");
    _exit(127);
}

static bool drain(int fd, std::string& into) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            into.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            return false; // EOF
        if (errno == EINTR)
            continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

CommandOutput execute(const Command& cmd) {
    UniqueFd out_r, out_w, err_r, err_w;
    if (!make_pipe(out_r, out_w) || !make_pipe(err_r, err_w))
        spawn_failed(cmd, "pipe");
    if (!set_nonblocking(out_r.get()) || !set_nonblocking(err_r.get()))
        spawn_failed(cmd, "fcntl");
    UniqueFd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devnull)
        spawn_failed(cmd, "open /dev/null");

    std::vector<char*> argv;
    argv.reserve(cmd.args.size() + 2);
    argv.push_back(const_cast<char*>(cmd.program.c_str()));
    for (const auto& a : cmd.args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    std::string cwd = cmd.cwd.string();

    pid_t pid = fork();
    if (pid < 0)
        spawn_failed(cmd, "fork");
    if (pid == 0) {
        if (dup2(devnull.get(), STDIN_FILENO) < 0 || dup2(out_w.get(), STDOUT_FILENO) < 0 ||
            dup2(err_w.get(), STDERR_FILENO) < 0)
            _exit(127);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0)
            child_fail("cannot change directory to ", cwd.c_str());
        execvp(argv[0], argv.data());
        child_fail("cannot execute ", argv[0]);
    }

    out_w.reset();
    err_w.reset();
    devnull.reset();

    CommandOutput result;
    bool out_open = true;
    bool err_open = true;
    while (out_open || err_open) {
        pollfd fds[2];
        nfds_t n = 0;
        if (out_open)
            fds[n++] = pollfd{out_r.get(), POLLIN, 0};
        if (err_open)
            fds[n++] = pollfd{err_r.get(), POLLIN, 0};
        int rc = poll(fds, n, -1);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (fds[i].revents == 0)
                continue;
            if (fds[i].fd == out_r.get())
                out_open = drain(out_r.get(), result.out);
            else
                err_open = drain(err_r.get(), result.err);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            spawn_failed(cmd, "waitpid");
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    else
        result.exit_code = -1;
    return result;
}

std::string run_command(const Command& cmd) {
    log_debug("Running command", {{"cmd", cmd.to_string()}, {"cwd", cmd.cwd.string()}});
    CommandOutput res = execute(cmd);
    if (res.exit_code != 0)
        throw CommandFailed(cmd.program, cmd.args, res.exit_code, trim(res.err));
    return trim(res.out);
}

std::string run_command(const std::string& program, const std::vector<std::string>& args,
                        const std::filesystem::path& cwd) {
    return run_command(Command{program, args, cwd});
}

CommandRunner process_runner() {
    return [](const Command& cmd) { return run_command(cmd); };
}

} // namespace procutil
