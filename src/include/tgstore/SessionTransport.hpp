#pragma once

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <string>
#include <string_view>

#include "PeerResolver.hpp"
#include "SessionApi.hpp"
#include "SpoolFile.hpp"
#include "Types.hpp"

namespace tgstore {

/**
 * @brief Transport over a single long-lived full-account session.
 *
 * The session is started lazily. start() is serialized: concurrent callers
 * block until the first one has finished, so exactly one session is created.
 * Once Ready, send and download calls run concurrently; each holds the
 * session open (shared) for its duration. close() waits for them to finish,
 * then returns the transport to Unstarted; the next call starts a fresh
 * session and re-resolves the destination.
 */
class SessionTransport {
   public:
    enum class State { Unstarted, Starting, Ready };

    struct SendResult {
        // Persistent remote file id, or the message id when there is none.
        std::string externalId;
        std::uint64_t size;
        std::string chatRef;
        MessageId messageRef;
    };

    struct Diagnostics {
        AccountInfo account;
        PeerHandle peer;
    };

    SessionTransport(std::unique_ptr<SessionApi> api,
                     ChatIdentifier destination);
    ~SessionTransport();

    SessionTransport(const SessionTransport&) = delete;
    SessionTransport& operator=(const SessionTransport&) = delete;

    /**
     * @brief Establishes the session. A no-op once Ready.
     *
     * Also tries to join the destination when it is an @handle or invite
     * link. A failed join is logged and ignored.
     */
    absl::Status start();

    /**
     * @brief Uploads a spooled payload to the destination.
     *
     * @param deadline The same global deadline the payload was spooled under.
     * @return The reference fields, TimeoutError when the deadline passed,
     * ResolutionError when the destination could not be confirmed and the
     * send failed, TransportError otherwise.
     */
    absl::StatusOr<SendResult> send(const SpoolFile& spool,
                                    std::string_view filename,
                                    std::string_view contentType,
                                    Deadline deadline);

    // Downloads the document of a stored message into a spool.
    absl::StatusOr<SpoolFile> downloadByReference(std::string_view chatRef,
                                                  MessageId messageRef);

    // Fallback when only a remote file id is known.
    absl::StatusOr<SpoolFile> downloadByExternalId(
        std::string_view externalId);

    void close();

    [[nodiscard]] State state() const { return _state.load(); }

    // Starts the session and reports who it runs as and where it sends.
    absl::StatusOr<Diagnostics> diagnose();

   private:
    absl::StatusOr<PeerHandle> resolvePeer();
    // Starts the session if needed and keeps it from being closed until the
    // returned lock is released.
    absl::StatusOr<std::shared_lock<std::shared_mutex>> acquireSession();

    std::unique_ptr<SessionApi> _api;
    const ChatIdentifier _destination;
    std::atomic<State> _state{State::Unstarted};
    std::mutex _startMutex;
    // Held shared by operations using the session, exclusively by close().
    std::shared_mutex _sessionMutex;
    std::mutex _peerMutex;
    std::optional<PeerHandle> _peer ABSL_GUARDED_BY(_peerMutex);
};

std::string_view toString(SessionTransport::State state);

}  // namespace tgstore
