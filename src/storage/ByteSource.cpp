#include <absl/log/log.h>
#include <fmt/format.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <limits>
#include <tgstore/ByteSource.hpp>
#include <tgstore/Errors.hpp>

namespace tgstore {

FdByteSource::FdByteSource(int fd, Ownership ownership,
                           std::optional<std::uint64_t> size)
    : _fd(fd), _ownership(ownership), _size(size) {}

FdByteSource::~FdByteSource() {
    if (_ownership == Ownership::Owned) {
        closeFd(_fd);
    }
}

absl::StatusOr<size_t> FdByteSource::read(std::span<char> buffer,
                                          std::chrono::milliseconds timeout) {
    if (!isValidFd(_fd)) {
        return absl::FailedPreconditionError("Source descriptor is closed");
    }
    if (timeout.count() <= 0) {
        return TimeoutError("No time left to read from source");
    }

    struct pollfd pfd {};
    pfd.fd = _fd;
    pfd.events = POLLIN;

    // poll(2) treats a negative timeout as infinite.
    const int waitMs = static_cast<int>(std::min<std::int64_t>(
        timeout.count(), std::numeric_limits<int>::max()));
    int rc = 0;
    do {
        rc = ::poll(&pfd, 1, waitMs);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        const int err = errno;
        PLOG(ERROR) << "poll failed on fd " << _fd;
        return absl::InternalError(
            fmt::format("poll: {}", std::strerror(err)));
    }
    if (rc == 0) {
        return TimeoutError(fmt::format(
            "No data received from source within {}ms", timeout.count()));
    }

    ssize_t n = 0;
    do {
        n = ::read(_fd, buffer.data(), buffer.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        const int err = errno;
        PLOG(ERROR) << "read failed on fd " << _fd;
        return absl::InternalError(
            fmt::format("read: {}", std::strerror(err)));
    }
    return static_cast<size_t>(n);
}

absl::StatusOr<size_t> StreamByteSource::read(
    std::span<char> buffer, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return TimeoutError("No time left to read from source");
    }
    if (_stream.bad()) {
        return absl::DataLossError("Source stream is in a bad state");
    }
    if (_stream.eof()) {
        return 0;
    }
    _stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (_stream.bad()) {
        return absl::DataLossError("Reading source stream failed");
    }
    return static_cast<size_t>(_stream.gcount());
}

}  // namespace tgstore
