#pragma once

#include <absl/status/statusor.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "BotApi.hpp"
#include "ByteStream.hpp"
#include "SpoolFile.hpp"
#include "Types.hpp"

namespace tgstore {

/**
 * @brief Stateless transport over the size-capped bot HTTP API.
 *
 * Uploads are a single multipart request carrying the whole spooled payload.
 * Downloads take two steps: a metadata lookup yields the CDN path, which is
 * then streamed lazily.
 */
class BotTransport {
   public:
    // Hard platform ceiling for bot uploads.
    static constexpr std::uint64_t kMaxUploadBytes = 50ULL * 1024 * 1024;

    struct SendResult {
        std::string externalId;
        std::uint64_t size;
    };

    BotTransport(std::unique_ptr<BotApi> api, ChatIdentifier destination);

    /**
     * @brief Uploads a spooled payload to the configured destination.
     *
     * No size check is done here; the transfer controller already applied
     * kMaxUploadBytes while spooling.
     *
     * @return The content id and size, or TransportError.
     */
    absl::StatusOr<SendResult> send(const SpoolFile& spool,
                                    std::string_view filename,
                                    std::string_view contentType) const;

    // NotFoundError if the platform no longer knows externalId.
    absl::StatusOr<BotFileInfo> fetchMetadata(
        std::string_view externalId) const;

    // Forward-only, not restartable.
    absl::StatusOr<std::unique_ptr<ByteStream>> openDownloadStream(
        std::string_view remotePath) const;

    [[nodiscard]] const ChatIdentifier& destination() const {
        return _destination;
    }

   private:
    std::unique_ptr<BotApi> _api;
    ChatIdentifier _destination;
};

}  // namespace tgstore
