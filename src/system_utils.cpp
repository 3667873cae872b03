#include "system_utils.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace procutil {

static bool set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (pipe(fds) != 0)
        return false;
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return set_cloexec(read_end.get()) && set_cloexec(write_end.get());
}

std::string trim(const std::string& s) {
    static const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace procutil
