#pragma once

#include <absl/status/statusor.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "SpoolFile.hpp"

namespace tgstore {

/**
 * @brief Forward-only, non-seekable outbound stream handed to callers of a
 * download.
 *
 * The caller must either drain it until read() returns 0 or drop it (or call
 * abort()) to release the resources behind it. It cannot be restarted.
 */
class ByteStream {
   public:
    static constexpr size_t kChunkSize = 64 * 1024;

    virtual ~ByteStream() = default;

    // Returns the number of bytes placed in buffer; 0 at end of stream.
    virtual absl::StatusOr<size_t> read(std::span<char> buffer) = 0;

    // Releases the underlying resource early. Further reads return 0.
    virtual void abort() = 0;
};

// Streams a spooled file and removes it once the stream is done with it.
class FileByteStream : public ByteStream {
   public:
    static absl::StatusOr<std::unique_ptr<FileByteStream>> open(
        SpoolFile spool);
    ~FileByteStream() override;

    absl::StatusOr<size_t> read(std::span<char> buffer) override;
    void abort() override;

   private:
    FileByteStream(SpoolFile spool, int fd);

    SpoolFile _spool;
    int _fd;
};

}  // namespace tgstore
