#pragma once

#include <absl/status/statusor.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "ByteSource.hpp"
#include "SpoolFile.hpp"
#include "Types.hpp"

namespace tgstore {

// Per-transfer accounting. Created for one upload and discarded with it.
struct TransferBudget {
    Deadline deadline;
    std::uint64_t bytesTransferred = 0;
    std::optional<std::uint64_t> limit;

    // Time left before the deadline, clamped at zero.
    [[nodiscard]] std::chrono::milliseconds remaining() const;
    [[nodiscard]] bool expired() const { return remaining().count() <= 0; }
    // Whether accepting `more` bytes would go over the limit.
    [[nodiscard]] bool wouldExceed(std::uint64_t more) const {
        return limit && bytesTransferred + more > *limit;
    }
};

struct SpoolResult {
    SpoolFile file;
    std::uint64_t totalBytes;
};

/**
 * @brief Drains an inbound byte source into a spool under a global deadline
 * and an optional size ceiling.
 *
 * Each read waits at most for the time remaining until the deadline, so a
 * slow but steady sender is not cut off early while the total transfer time
 * stays bounded. A chunk that would take the total past the size limit is
 * never written; the spool is removed on every failure path.
 */
class TransferController {
   public:
    static constexpr size_t kChunkSize = 1024 * 1024;

    explicit TransferController(size_t chunkSize = kChunkSize);

    /**
     * @brief Spools `source` to a temporary file.
     *
     * @param source The inbound stream, read until it reports end of stream.
     * @param deadline Absolute time by which the whole source must be read.
     * @param sizeLimit Ceiling for the total byte count, if any.
     * @param spoolName File name to give the spooled payload.
     * @return The finalized spool and its size, SizeLimitExceeded,
     * TimeoutError, or the source's own error.
     */
    absl::StatusOr<SpoolResult> spool(
        ByteSource& source, Deadline deadline,
        std::optional<std::uint64_t> sizeLimit,
        std::string_view spoolName = {}) const;

   private:
    size_t _chunkSize;
};

}  // namespace tgstore
