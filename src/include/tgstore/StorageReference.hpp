#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "Types.hpp"

namespace tgstore {

/**
 * @brief Durable result of a successful upload.
 *
 * Immutable once built. The chat/message pair only exists for session-mode
 * uploads and is always set or unset as a whole; the type keeps it in a
 * single optional so a half-set reference cannot be constructed.
 */
class StorageReference {
   public:
    struct MessageRef {
        std::string chat;
        MessageId message;

        bool operator==(const MessageRef&) const = default;
    };

    // Reference produced by the bot transport.
    static StorageReference forBot(std::string externalId, std::string name,
                                   std::uint64_t size);

    // Reference produced by the session transport. An empty externalId is
    // replaced by the message id.
    static StorageReference forSession(std::string externalId,
                                       std::string name, std::uint64_t size,
                                       std::string chatRef,
                                       MessageId messageRef);

    /**
     * @brief Rebuilds a reference from a persisted record.
     *
     * If only one of chatRef/messageRef is present both are dropped (with a
     * warning) and the reference falls back to its externalId.
     */
    static StorageReference fromRecord(std::string externalId,
                                       std::string name, std::uint64_t size,
                                       std::optional<std::string> chatRef,
                                       std::optional<MessageId> messageRef);

    [[nodiscard]] const std::string& externalId() const { return _externalId; }
    [[nodiscard]] const std::string& name() const { return _name; }
    [[nodiscard]] std::uint64_t size() const { return _size; }
    [[nodiscard]] std::optional<std::string> chatRef() const;
    [[nodiscard]] std::optional<MessageId> messageRef() const;
    [[nodiscard]] bool hasMessageRef() const { return _message.has_value(); }
    [[nodiscard]] const std::optional<MessageRef>& message() const {
        return _message;
    }

    bool operator==(const StorageReference&) const = default;

   private:
    StorageReference(std::string externalId, std::string name,
                     std::uint64_t size, std::optional<MessageRef> message);

    std::string _externalId;
    std::string _name;
    std::uint64_t _size;
    std::optional<MessageRef> _message;
};

std::ostream& operator<<(std::ostream& os, const StorageReference& reference);

}  // namespace tgstore
