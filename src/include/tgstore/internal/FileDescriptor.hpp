#pragma once

#include <absl/log/log.h>
#include <unistd.h>

#include <array>
#include <cerrno>

namespace tgstore {

constexpr int kInvalidFD = -1;

inline bool isValidFd(int fd) { return fd != kInvalidFD; }

inline void closeFd(int& fd) {
    int rc = 0;

    if (isValidFd(fd)) {
        rc = ::close(fd);
    }

    PLOG_IF(ERROR, (rc != 0 && errno != EBADF))
        << "Failed to close fd: " << fd;
    fd = kInvalidFD;
}

/**
 * @brief A pipe(2) pair, used to feed descriptor-backed byte sources.
 *
 * The descriptors are not closed on destruction; call close() or hand the
 * ends to their owners.
 */
struct Pipe {
    [[nodiscard]] bool isValid() const {
        return isValidFd(underlying[0]) && isValidFd(underlying[1]);
    }

    bool pipe() {
        int rc = ::pipe(underlying.data());
        PLOG_IF(ERROR, rc != 0) << "Failed to create pipe";
        return rc == 0;
    }

    void close() {
        closeFd(underlying[0]);
        closeFd(underlying[1]);
    }

    void closeReadEnd() { closeFd(underlying[0]); }
    void closeWriteEnd() { closeFd(underlying[1]); }

    [[nodiscard]] int readEnd() const { return underlying[0]; }
    [[nodiscard]] int writeEnd() const { return underlying[1]; }

    std::array<int, 2> underlying{kInvalidFD, kInvalidFD};
};

}  // namespace tgstore
