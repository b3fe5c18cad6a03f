#include <absl/log/log.h>
#include <absl/strings/numbers.h>
#include <fmt/format.h>

#include <tgstore/Errors.hpp>
#include <tgstore/SessionTransport.hpp>
#include <utility>

namespace tgstore {

std::string_view toString(const SessionTransport::State state) {
    switch (state) {
        case SessionTransport::State::Unstarted:
            return "unstarted";
        case SessionTransport::State::Starting:
            return "starting";
        case SessionTransport::State::Ready:
            return "ready";
    }
    return "unknown";
}

SessionTransport::SessionTransport(std::unique_ptr<SessionApi> api,
                                   ChatIdentifier destination)
    : _api(std::move(api)), _destination(std::move(destination)) {}

SessionTransport::~SessionTransport() { close(); }

absl::Status SessionTransport::start() {
    if (_state.load() == State::Ready) {
        return absl::OkStatus();
    }
    const std::lock_guard<std::mutex> lock(_startMutex);
    if (_state.load() == State::Ready) {
        return absl::OkStatus();
    }
    _state = State::Starting;
    LOG(INFO) << "Starting session";
    if (auto status = _api->connect(); !status.ok()) {
        _state = State::Unstarted;
        LOG(ERROR) << "Failed to start session: " << status;
        return withContext(status, "Starting session");
    }

    if (const auto* target = std::get_if<std::string>(&_destination)) {
        const ChatIdentifier normalized = PeerResolver::normalize(*target);
        const auto& str = std::get<std::string>(normalized);
        if (PeerResolver::looksJoinable(str)) {
            // Already being a member, or a link that needs approval, both
            // end up here.
            if (auto joined = _api->joinChat(str); !joined.ok()) {
                LOG(INFO) << fmt::format("Auto-join of {} failed: {}", str,
                                         joined.message());
            } else {
                LOG(INFO) << "Joined " << str;
            }
        }
    }
    {
        const std::lock_guard<std::mutex> peerLock(_peerMutex);
        _peer.reset();
    }
    _state = State::Ready;
    LOG(INFO) << "Session is ready";
    return absl::OkStatus();
}

absl::StatusOr<std::shared_lock<std::shared_mutex>>
SessionTransport::acquireSession() {
    while (true) {
        if (auto status = start(); !status.ok()) {
            return status;
        }
        std::shared_lock<std::shared_mutex> lock(_sessionMutex);
        // A close() may have run between start() and taking the lock.
        if (_state.load() == State::Ready) {
            return lock;
        }
    }
}

void SessionTransport::close() {
    const std::lock_guard<std::mutex> lock(_startMutex);
    if (_state.load() == State::Unstarted) {
        return;
    }
    const std::unique_lock<std::shared_mutex> sessionLock(_sessionMutex);
    _api->disconnect();
    {
        const std::lock_guard<std::mutex> peerLock(_peerMutex);
        _peer.reset();
    }
    _state = State::Unstarted;
    LOG(INFO) << "Session closed";
}

absl::StatusOr<PeerHandle> SessionTransport::resolvePeer() {
    const std::lock_guard<std::mutex> lock(_peerMutex);
    if (_peer) {
        return *_peer;
    }
    const PeerResolver resolver(_api.get());
    auto peer = resolver.resolve(_destination);
    if (!peer.ok()) {
        return peer.status();
    }
    _peer = *peer;
    return peer;
}

absl::StatusOr<SessionTransport::SendResult> SessionTransport::send(
    const SpoolFile& spool, const std::string_view filename,
    const std::string_view contentType, const Deadline deadline) {
    auto session = acquireSession();
    if (!session.ok()) {
        return session.status();
    }
    auto peer = resolvePeer();
    if (!peer.ok()) {
        return peer.status();
    }
    LOG(INFO) << fmt::format("Uploading {} ({} bytes) to {} via session",
                             filename, spool.size(), peer->target);

    auto sent = _api->sendDocument(peer->target, spool.path(), filename,
                                   contentType, deadline);
    if (!sent.ok()) {
        const auto context =
            fmt::format("Upload of {} ({} bytes) to {}", filename,
                        spool.size(), _destination);
        if (errorKindOf(sent.status()) != ErrorKind::kTimeout &&
            !peer->confirmed()) {
            return ResolutionError(fmt::format(
                "{}: {}. The destination could not be resolved; make sure "
                "the session has access to {}",
                context, sent.status().message(), _destination));
        }
        return withContext(sent.status(), context);
    }

    SendResult result;
    result.chatRef = std::to_string(sent->chatId);
    result.messageRef = sent->messageId;
    result.size = sent->size != 0 ? sent->size : spool.size();
    result.externalId = sent->remoteFileId.empty()
                            ? std::to_string(sent->messageId)
                            : std::move(sent->remoteFileId);
    LOG(INFO) << fmt::format("Uploaded {} as message {} in chat {}", filename,
                             result.messageRef, result.chatRef);
    return result;
}

absl::StatusOr<SpoolFile> SessionTransport::downloadByReference(
    const std::string_view chatRef, const MessageId messageRef) {
    auto session = acquireSession();
    if (!session.ok()) {
        return session.status();
    }
    ChatId chat = 0;
    if (!absl::SimpleAtoi(chatRef, &chat)) {
        return NotFoundError(
            fmt::format("Stored chat reference '{}' is not a chat id", chatRef));
    }
    auto spool = _api->downloadMessageDocument(chat, messageRef);
    if (!spool.ok()) {
        return withContext(spool.status(),
                           fmt::format("Download of message {} in chat {}",
                                       messageRef, chatRef));
    }
    return spool;
}

absl::StatusOr<SpoolFile> SessionTransport::downloadByExternalId(
    const std::string_view externalId) {
    auto session = acquireSession();
    if (!session.ok()) {
        return session.status();
    }
    auto spool = _api->downloadRemoteFile(externalId);
    if (!spool.ok()) {
        return withContext(spool.status(),
                           fmt::format("Download of file {}", externalId));
    }
    return spool;
}

absl::StatusOr<SessionTransport::Diagnostics> SessionTransport::diagnose() {
    auto session = acquireSession();
    if (!session.ok()) {
        return session.status();
    }
    auto account = _api->getMe();
    if (!account.ok()) {
        return withContext(account.status(), "Looking up session account");
    }
    auto peer = resolvePeer();
    if (!peer.ok()) {
        return peer.status();
    }
    return Diagnostics{std::move(*account), std::move(*peer)};
}

}  // namespace tgstore
