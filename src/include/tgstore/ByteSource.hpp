#pragma once

#include <absl/status/statusor.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <span>

#include "internal/FileDescriptor.hpp"

namespace tgstore {

/**
 * @brief Forward-only inbound byte source, e.g. a request body being
 * received.
 *
 * read() is the only suspension point for an upload being spooled. It must
 * return within `timeout` when no data arrives, so the caller can enforce an
 * overall transfer deadline.
 */
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    /**
     * @brief Reads up to buffer.size() bytes.
     *
     * @param buffer Destination buffer.
     * @param timeout Longest time to wait for at least one byte.
     * @return Number of bytes read, 0 at end of stream, DeadlineExceeded if
     * nothing arrived in time, or another error from the underlying source.
     */
    virtual absl::StatusOr<size_t> read(std::span<char> buffer,
                                        std::chrono::milliseconds timeout) = 0;

    // Total length when the source knows it up front.
    [[nodiscard]] virtual std::optional<std::uint64_t> sizeHint() const {
        return std::nullopt;
    }
};

// Reads from a file descriptor (pipe, socket or regular file), waiting with
// poll(2).
class FdByteSource : public ByteSource {
   public:
    enum class Ownership { Borrowed, Owned };

    explicit FdByteSource(int fd, Ownership ownership = Ownership::Borrowed,
                          std::optional<std::uint64_t> size = std::nullopt);
    ~FdByteSource() override;

    FdByteSource(const FdByteSource&) = delete;
    FdByteSource& operator=(const FdByteSource&) = delete;

    absl::StatusOr<size_t> read(std::span<char> buffer,
                                std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::optional<std::uint64_t> sizeHint() const override {
        return _size;
    }

   private:
    int _fd;
    Ownership _ownership;
    std::optional<std::uint64_t> _size;
};

// Reads from a std::istream. Streams cannot be waited on, so the timeout only
// applies between reads.
class StreamByteSource : public ByteSource {
   public:
    explicit StreamByteSource(std::istream& stream,
                              std::optional<std::uint64_t> size = std::nullopt)
        : _stream(stream), _size(size) {}

    absl::StatusOr<size_t> read(std::span<char> buffer,
                                std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::optional<std::uint64_t> sizeHint() const override {
        return _size;
    }

   private:
    std::istream& _stream;
    std::optional<std::uint64_t> _size;
};

}  // namespace tgstore
