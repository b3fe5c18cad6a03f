#include <absl/log/log.h>
#include <fcntl.h>
#include <fmt/format.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <tgstore/ByteStream.hpp>
#include <utility>

namespace tgstore {

absl::StatusOr<std::unique_ptr<FileByteStream>> FileByteStream::open(
    SpoolFile spool) {
    if (auto status = spool.finalize(); !status.ok()) {
        return status;
    }
    int fd = ::open(spool.path().c_str(), O_RDONLY | O_CLOEXEC);
    if (!isValidFd(fd)) {
        const int err = errno;
        return absl::InternalError(fmt::format(
            "Cannot open spool {}: {}", spool.path().string(),
            std::strerror(err)));
    }
    return std::unique_ptr<FileByteStream>(
        new FileByteStream(std::move(spool), fd));
}

FileByteStream::FileByteStream(SpoolFile spool, int fd)
    : _spool(std::move(spool)), _fd(fd) {}

FileByteStream::~FileByteStream() { abort(); }

absl::StatusOr<size_t> FileByteStream::read(std::span<char> buffer) {
    if (!isValidFd(_fd)) {
        return 0;
    }
    ssize_t n = 0;
    do {
        n = ::read(_fd, buffer.data(), std::min(buffer.size(), kChunkSize));
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        const int err = errno;
        return absl::InternalError(
            fmt::format("read spool: {}", std::strerror(err)));
    }
    if (n == 0) {
        // Drained, the spool is no longer needed.
        abort();
    }
    return static_cast<size_t>(n);
}

void FileByteStream::abort() {
    closeFd(_fd);
    _spool.discard();
}

}  // namespace tgstore
