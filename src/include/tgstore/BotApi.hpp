#pragma once

#include <absl/status/statusor.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include "ByteStream.hpp"
#include "Types.hpp"

namespace tgstore {

struct BotDocument {
    // Content id accepted by getFile().
    std::string fileId;
    std::uint64_t size = 0;
};

struct BotFileInfo {
    // Path on the file CDN, relative to the bot's file endpoint.
    std::string remotePath;
    std::uint64_t size = 0;
};

// Base interface for operations against the size-capped bot HTTP API.
class BotApi {
   public:
    using Ptr = std::add_pointer_t<BotApi>;

    BotApi() = default;
    virtual ~BotApi() = default;

    BotApi(const BotApi&) = delete;
    BotApi& operator=(const BotApi&) = delete;

   protected:
    /**
     * @brief Uploads a local file as a document in a single multipart
     * request.
     *
     * @param chat The destination chat.
     * @param file The local file to upload.
     * @param filename The document file name.
     * @param contentType MIME type of the document. Empty means
     * application/octet-stream.
     * @return The uploaded document, or TransportError if the request failed
     * or the response did not describe a document.
     */
    virtual absl::StatusOr<BotDocument> sendDocument_impl(
        const ChatIdentifier& chat, const std::filesystem::path& file,
        std::string_view filename, std::string_view contentType) = 0;

    /**
     * @brief Looks up a file's CDN path.
     *
     * @param fileId The content id returned by sendDocument().
     * @return The file info, NotFoundError if the id is unknown, or
     * TransportError.
     */
    virtual absl::StatusOr<BotFileInfo> getFile_impl(
        std::string_view fileId) = 0;

    /**
     * @brief Opens a lazy stream over a file on the CDN.
     *
     * Nothing is transferred until the stream is read.
     *
     * @param remotePath The path returned by getFile().
     */
    virtual absl::StatusOr<std::unique_ptr<ByteStream>> openFile_impl(
        std::string_view remotePath) = 0;

   public:
    [[nodiscard]] absl::StatusOr<BotDocument> sendDocument(
        const ChatIdentifier& chat, const std::filesystem::path& file,
        std::string_view filename, std::string_view contentType) {
        return sendDocument_impl(chat, file, filename, contentType);
    }

    [[nodiscard]] absl::StatusOr<BotFileInfo> getFile(std::string_view fileId) {
        return getFile_impl(fileId);
    }

    [[nodiscard]] absl::StatusOr<std::unique_ptr<ByteStream>> openFile(
        std::string_view remotePath) {
        return openFile_impl(remotePath);
    }
};

}  // namespace tgstore
