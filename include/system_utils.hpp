#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP

#include <string>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Used for the
 * pipes connecting autodeploy to its child processes and for the
 * self-pipe of the interval timer.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Create a close-on-exec pipe.
 *
 * @param read_end  Receives the read side.
 * @param write_end Receives the write side.
 * @return `true` on success; on failure `errno` describes the error.
 */
bool make_pipe(UniqueFd& read_end, UniqueFd& write_end);

/** Switch @p fd to non-blocking mode. */
bool set_nonblocking(int fd);

/**
 * @brief Remove leading and trailing whitespace (space, tab, CR, LF, FF, VT).
 */
std::string trim(const std::string& s);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
