#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "BotTransport.hpp"
#include "ByteSource.hpp"
#include "ByteStream.hpp"
#include "SessionTransport.hpp"
#include "StorageConfig.hpp"
#include "StorageReference.hpp"
#include "TransferController.hpp"
#include "Types.hpp"

namespace tgstore {

/**
 * @brief Transport-agnostic entry point for storing and fetching files.
 *
 * The transport is chosen once, when the client is built, and never changes.
 * Every upload is spooled through the TransferController first, so the size
 * ceiling and the deadline behave the same whichever transport is active.
 */
class StorageClient {
   public:
    using Transport = std::variant<std::unique_ptr<BotTransport>,
                                   std::unique_ptr<SessionTransport>>;

    struct Download {
        std::unique_ptr<ByteStream> stream;
        std::string name;
        std::uint64_t size = 0;
    };

    /**
     * @brief Builds the client for the configured transport.
     *
     * Does not contact the platform; a session transport starts lazily.
     */
    static absl::StatusOr<std::unique_ptr<StorageClient>> create(
        const StorageConfig& config);

    StorageClient(Transport transport, std::chrono::seconds uploadTimeout,
                  std::optional<std::uint64_t> sizeLimit,
                  TransferController controller = TransferController());
    ~StorageClient();

    StorageClient(const StorageClient&) = delete;
    StorageClient& operator=(const StorageClient&) = delete;

    /**
     * @brief Stores the contents of a byte source.
     *
     * @param source The inbound payload, read until end of stream.
     * @param filename Name to store the payload under.
     * @param contentType MIME type, may be empty.
     * @param sizeHint Expected size when known. A hint above the active
     * ceiling fails before anything is read.
     * @return The reference to persist, or SizeLimitExceeded, TimeoutError,
     * TransportError, ResolutionError.
     */
    absl::StatusOr<StorageReference> upload(
        ByteSource& source, std::string_view filename,
        std::string_view contentType,
        std::optional<std::uint64_t> sizeHint = std::nullopt);

    /**
     * @brief Opens a stored file for reading.
     *
     * A session-mode reference carrying a chat/message pair is fetched by
     * message; otherwise the externalId is used.
     *
     * @return The stream with the file name and size, or NotFoundError.
     */
    absl::StatusOr<Download> download(const StorageReference& reference);

    // Closes the session, if any. The client may be used again afterwards.
    void shutdown();

    [[nodiscard]] TransportMode mode() const;
    [[nodiscard]] std::optional<std::uint64_t> sizeLimit() const {
        return _sizeLimit;
    }
    // Lifecycle of the session transport; nullopt in bot mode.
    [[nodiscard]] std::optional<SessionTransport::State> sessionState() const;

    // Session mode only: who the session is and where uploads go.
    absl::StatusOr<SessionTransport::Diagnostics> diagnose();

   private:
    absl::StatusOr<Download> downloadFromBot(BotTransport& transport,
                                             const StorageReference& reference);
    absl::StatusOr<Download> downloadFromSession(
        SessionTransport& transport, const StorageReference& reference);

    Transport _transport;
    std::chrono::seconds _uploadTimeout;
    std::optional<std::uint64_t> _sizeLimit;
    TransferController _controller;
};

}  // namespace tgstore
