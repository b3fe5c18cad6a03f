#include <absl/log/log.h>
#include <fmt/format.h>

#include <filesystem>
#include <tgstore/Errors.hpp>
#include <tgstore/StorageClient.hpp>
#include <type_traits>
#include <utility>

namespace tgstore {

namespace {
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
}  // namespace

StorageClient::StorageClient(Transport transport,
                             const std::chrono::seconds uploadTimeout,
                             std::optional<std::uint64_t> sizeLimit,
                             TransferController controller)
    : _transport(std::move(transport)),
      _uploadTimeout(uploadTimeout),
      _sizeLimit(sizeLimit),
      _controller(controller) {
    LOG(INFO) << fmt::format("Storage client using {} transport", mode());
}

StorageClient::~StorageClient() { shutdown(); }

TransportMode StorageClient::mode() const {
    return std::holds_alternative<std::unique_ptr<BotTransport>>(_transport)
               ? TransportMode::Bot
               : TransportMode::Session;
}

std::optional<SessionTransport::State> StorageClient::sessionState() const {
    if (const auto* session =
            std::get_if<std::unique_ptr<SessionTransport>>(&_transport)) {
        return (*session)->state();
    }
    return std::nullopt;
}

absl::StatusOr<StorageReference> StorageClient::upload(
    ByteSource& source, const std::string_view filename,
    const std::string_view contentType,
    const std::optional<std::uint64_t> sizeHint) {
    if (sizeHint && _sizeLimit && *sizeHint > *_sizeLimit) {
        LOG(WARNING) << fmt::format(
            "Rejecting {}: declared size {} exceeds the {} mode limit of {}",
            filename, *sizeHint, mode(), *_sizeLimit);
        return SizeLimitExceededError(
            fmt::format("{} is {} bytes, the {} mode limit is {} bytes",
                        filename, *sizeHint, mode(), *_sizeLimit));
    }

    const Deadline deadline = Clock::now() + _uploadTimeout;
    auto spooled = _controller.spool(source, deadline, _sizeLimit, filename);
    if (!spooled.ok()) {
        return spooled.status();
    }

    return std::visit(
        overloaded{
            [&](const std::unique_ptr<BotTransport>& bot)
                -> absl::StatusOr<StorageReference> {
                auto sent = bot->send(spooled->file, filename, contentType);
                if (!sent.ok()) {
                    return sent.status();
                }
                return StorageReference::forBot(std::move(sent->externalId),
                                                std::string(filename),
                                                sent->size);
            },
            [&](const std::unique_ptr<SessionTransport>& session)
                -> absl::StatusOr<StorageReference> {
                auto sent = session->send(spooled->file, filename,
                                          contentType, deadline);
                if (!sent.ok()) {
                    return sent.status();
                }
                return StorageReference::forSession(
                    std::move(sent->externalId), std::string(filename),
                    sent->size, std::move(sent->chatRef), sent->messageRef);
            },
        },
        _transport);
}

absl::StatusOr<StorageClient::Download> StorageClient::downloadFromBot(
    BotTransport& transport, const StorageReference& reference) {
    if (reference.externalId().empty()) {
        return NotFoundError("Reference carries no file id");
    }
    auto metadata = transport.fetchMetadata(reference.externalId());
    if (!metadata.ok()) {
        return metadata.status();
    }
    auto stream = transport.openDownloadStream(metadata->remotePath);
    if (!stream.ok()) {
        return stream.status();
    }
    Download result;
    result.stream = std::move(*stream);
    result.name = !reference.name().empty()
                      ? reference.name()
                      : std::filesystem::path(metadata->remotePath)
                            .filename()
                            .string();
    result.size = metadata->size != 0 ? metadata->size : reference.size();
    return result;
}

absl::StatusOr<StorageClient::Download> StorageClient::downloadFromSession(
    SessionTransport& transport, const StorageReference& reference) {
    absl::StatusOr<SpoolFile> spool;
    if (const auto& message = reference.message(); message) {
        spool = transport.downloadByReference(message->chat, message->message);
    } else if (!reference.externalId().empty()) {
        spool = transport.downloadByExternalId(reference.externalId());
    } else {
        return NotFoundError("Reference carries neither a message nor a file id");
    }
    if (!spool.ok()) {
        return spool.status();
    }
    Download result;
    result.name = !reference.name().empty()
                      ? reference.name()
                      : spool->path().filename().string();
    result.size = reference.size() != 0 ? reference.size() : spool->size();
    auto stream = FileByteStream::open(std::move(*spool));
    if (!stream.ok()) {
        return stream.status();
    }
    result.stream = std::move(*stream);
    return result;
}

absl::StatusOr<StorageClient::Download> StorageClient::download(
    const StorageReference& reference) {
    return std::visit(
        overloaded{
            [&](const std::unique_ptr<BotTransport>& bot) {
                return downloadFromBot(*bot, reference);
            },
            [&](const std::unique_ptr<SessionTransport>& session) {
                return downloadFromSession(*session, reference);
            },
        },
        _transport);
}

void StorageClient::shutdown() {
    if (auto* session =
            std::get_if<std::unique_ptr<SessionTransport>>(&_transport)) {
        (*session)->close();
    }
}

absl::StatusOr<SessionTransport::Diagnostics> StorageClient::diagnose() {
    auto* session = std::get_if<std::unique_ptr<SessionTransport>>(&_transport);
    if (session == nullptr) {
        return ConfigurationError(
            "Diagnostics are only available in session mode");
    }
    return (*session)->diagnose();
}

}  // namespace tgstore
