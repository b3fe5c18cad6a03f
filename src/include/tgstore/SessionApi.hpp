#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <type_traits>

#include "SpoolFile.hpp"
#include "Types.hpp"

namespace tgstore {

struct ChatInfo {
    ChatId id = 0;
    std::string title;
};

struct AccountInfo {
    std::int64_t id = 0;
    std::string username;
    std::string phoneNumber;
};

struct SentDocument {
    ChatId chatId = 0;
    MessageId messageId = 0;
    // Persistent remote file id; may be empty.
    std::string remoteFileId;
    std::uint64_t size = 0;
};

// Base interface for operations against the full-account session protocol.
// One instance represents one authenticated session.
class SessionApi {
   public:
    using Ptr = std::add_pointer_t<SessionApi>;

    SessionApi() = default;
    virtual ~SessionApi() = default;

    SessionApi(const SessionApi&) = delete;
    SessionApi(SessionApi&&) = delete;
    SessionApi& operator=(const SessionApi&) = delete;
    SessionApi& operator=(SessionApi&&) = delete;

   protected:
    /**
     * @brief Establishes the authenticated session.
     *
     * Blocks until the session is usable or has failed. An unauthorized
     * session database is a configuration problem, not a transport one.
     *
     * @return OK when ready, ConfigurationError when the stored session is
     * not authorized, TransportError otherwise.
     */
    virtual absl::Status connect_impl() = 0;

    /**
     * @brief Tears the session down. Safe to call on a closed session.
     */
    virtual void disconnect_impl() = 0;

    /**
     * @brief Returns the account the session is authenticated as.
     */
    virtual absl::StatusOr<AccountInfo> getMe_impl() = 0;

    /**
     * @brief Looks a chat up exactly as identified.
     *
     * Numeric identifiers are looked up by id. Strings are interpreted as a
     * public username (with or without '@') or an invite link; a string that
     * merely looks numeric is not converted.
     *
     * @param chat The identifier to look up.
     * @return The chat, or NotFoundError / TransportError.
     */
    virtual absl::StatusOr<ChatInfo> getChat_impl(
        const ChatIdentifier& chat) = 0;

    /**
     * @brief Joins a chat given by @handle or invite link.
     */
    virtual absl::Status joinChat_impl(std::string_view target) = 0;

    /**
     * @brief Sends a local file as a document and waits for the upload to
     * finish.
     *
     * @param chat The destination; usually a resolved numeric id.
     * @param file The local file to upload.
     * @param filename Document file name shown to recipients.
     * @param contentType MIME type of the document, may be empty.
     * @param deadline Absolute time after which the send is abandoned.
     * @return The sent document, TimeoutError on deadline, or TransportError.
     */
    virtual absl::StatusOr<SentDocument> sendDocument_impl(
        const ChatIdentifier& chat, const std::filesystem::path& file,
        std::string_view filename, std::string_view contentType,
        Deadline deadline) = 0;

    /**
     * @brief Downloads the document attached to a message into a spool.
     *
     * @return The spooled file, or NotFoundError if the message or its
     * document is gone.
     */
    virtual absl::StatusOr<SpoolFile> downloadMessageDocument_impl(
        ChatId chat, MessageId message) = 0;

    /**
     * @brief Downloads a file by its persistent remote id into a spool.
     */
    virtual absl::StatusOr<SpoolFile> downloadRemoteFile_impl(
        std::string_view remoteFileId) = 0;

   public:
    absl::Status connect() { return connect_impl(); }
    void disconnect() { disconnect_impl(); }

    [[nodiscard]] absl::StatusOr<AccountInfo> getMe() { return getMe_impl(); }

    [[nodiscard]] absl::StatusOr<ChatInfo> getChat(
        const ChatIdentifier& chat) {
        return getChat_impl(chat);
    }

    absl::Status joinChat(std::string_view target) {
        return joinChat_impl(target);
    }

    [[nodiscard]] absl::StatusOr<SentDocument> sendDocument(
        const ChatIdentifier& chat, const std::filesystem::path& file,
        std::string_view filename, std::string_view contentType,
        Deadline deadline) {
        return sendDocument_impl(chat, file, filename, contentType, deadline);
    }

    [[nodiscard]] absl::StatusOr<SpoolFile> downloadMessageDocument(
        ChatId chat, MessageId message) {
        return downloadMessageDocument_impl(chat, message);
    }

    [[nodiscard]] absl::StatusOr<SpoolFile> downloadRemoteFile(
        std::string_view remoteFileId) {
        return downloadRemoteFile_impl(remoteFileId);
    }
};

}  // namespace tgstore
