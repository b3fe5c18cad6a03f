#include <absl/log/log.h>

#include <tgstore/StorageReference.hpp>
#include <utility>

namespace tgstore {

StorageReference::StorageReference(std::string externalId, std::string name,
                                   std::uint64_t size,
                                   std::optional<MessageRef> message)
    : _externalId(std::move(externalId)),
      _name(std::move(name)),
      _size(size),
      _message(std::move(message)) {}

StorageReference StorageReference::forBot(std::string externalId,
                                          std::string name,
                                          std::uint64_t size) {
    return {std::move(externalId), std::move(name), size, std::nullopt};
}

StorageReference StorageReference::forSession(std::string externalId,
                                              std::string name,
                                              std::uint64_t size,
                                              std::string chatRef,
                                              MessageId messageRef) {
    if (externalId.empty()) {
        externalId = std::to_string(messageRef);
    }
    return {std::move(externalId), std::move(name), size,
            MessageRef{.chat = std::move(chatRef), .message = messageRef}};
}

StorageReference StorageReference::fromRecord(
    std::string externalId, std::string name, std::uint64_t size,
    std::optional<std::string> chatRef, std::optional<MessageId> messageRef) {
    std::optional<MessageRef> message;
    if (chatRef && messageRef) {
        message = MessageRef{.chat = std::move(*chatRef),
                             .message = *messageRef};
    } else if (chatRef || messageRef) {
        LOG(WARNING) << "Record " << externalId
                     << " has a partial message reference, ignoring it";
    }
    return {std::move(externalId), std::move(name), size, std::move(message)};
}

std::optional<std::string> StorageReference::chatRef() const {
    if (_message) {
        return _message->chat;
    }
    return std::nullopt;
}

std::optional<MessageId> StorageReference::messageRef() const {
    if (_message) {
        return _message->message;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const StorageReference& reference) {
    os << "external_id=" << reference.externalId() << '\n'
       << "name=" << reference.name() << '\n'
       << "size=" << reference.size() << '\n';
    if (reference.hasMessageRef()) {
        os << "chat_ref=" << reference.message()->chat << '\n'
           << "message_ref=" << reference.message()->message << '\n';
    }
    return os;
}

}  // namespace tgstore
