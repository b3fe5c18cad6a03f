#pragma once

#include <absl/base/thread_annotations.h>
#include <absl/container/flat_hash_map.h>
#include <td/telegram/Client.h>
#include <td/telegram/td_api.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

#include <tgstore/SessionApi.hpp>
#include <tgstore/internal/SendRegistry.hpp>

namespace tgstore {

// SessionApi on top of TDLib. The session database must already be
// authorized; this class never prompts for a login.
class TdSessionApi : public SessionApi {
   public:
    struct Options {
        std::int32_t apiId = 0;
        std::string apiHash;
        std::filesystem::path sessionDir;
        // Bound for plain requests (lookups, joins, metadata).
        std::chrono::seconds requestTimeout{60};
        // Bound for a synchronous file download.
        std::chrono::seconds transferTimeout{1800};
    };

    explicit TdSessionApi(Options options);
    ~TdSessionApi() override;

   protected:
    absl::Status connect_impl() override;
    void disconnect_impl() override;
    absl::StatusOr<AccountInfo> getMe_impl() override;
    absl::StatusOr<ChatInfo> getChat_impl(const ChatIdentifier& chat) override;
    absl::Status joinChat_impl(std::string_view target) override;
    absl::StatusOr<SentDocument> sendDocument_impl(
        const ChatIdentifier& chat, const std::filesystem::path& file,
        std::string_view filename, std::string_view contentType,
        Deadline deadline) override;
    absl::StatusOr<SpoolFile> downloadMessageDocument_impl(
        ChatId chat, MessageId message) override;
    absl::StatusOr<SpoolFile> downloadRemoteFile_impl(
        std::string_view remoteFileId) override;

   private:
    using Object = td::td_api::object_ptr<td::td_api::Object>;
    using Function = td::td_api::object_ptr<td::td_api::Function>;
    // (chat id, temporary message id) of an outgoing message.
    using PendingSend = std::pair<std::int64_t, std::int64_t>;

    enum class AuthState { Waiting, Ready, Unauthorized, Closed };

    struct SendOutcome {
        // The sent message, or null if sending failed.
        td::td_api::object_ptr<td::td_api::message> message;
        std::string failure;
    };

    // Sends a request and waits for its response until deadline.
    absl::StatusOr<Object> request(Function function, Deadline deadline);
    template <typename T>
    absl::StatusOr<td::td_api::object_ptr<T>> call(Function function,
                                                   Deadline deadline);
    // Sends a request whose response is only logged.
    void post(Function function);

    [[nodiscard]] Deadline requestDeadline() const {
        return Clock::now() + _options.requestTimeout;
    }

    void receiveLoop(const std::stop_token& token);
    void onUpdate(Object update);
    void onAuthorizationState(
        td::td_api::object_ptr<td::td_api::AuthorizationState> state);

    absl::StatusOr<td::td_api::object_ptr<td::td_api::chat>> lookupChat(
        const ChatIdentifier& chat, Deadline deadline);
    absl::StatusOr<SendOutcome> awaitSendOutcome(const PendingSend& key,
                                                 Deadline deadline);
    absl::StatusOr<SpoolFile> downloadToSpool(std::int32_t fileId,
                                              std::string name);

    Options _options;
    std::unique_ptr<td::ClientManager> _manager;
    std::int32_t _clientId = 0;
    std::atomic<std::uint64_t> _nextRequestId{1};

    std::mutex _mutex;
    std::condition_variable _cv;
    AuthState _authState ABSL_GUARDED_BY(_mutex) = AuthState::Closed;
    absl::flat_hash_map<std::uint64_t, std::promise<Object>> _pending
        ABSL_GUARDED_BY(_mutex);
    SendRegistry<PendingSend, SendOutcome> _sendOutcomes
        ABSL_GUARDED_BY(_mutex);

    std::jthread _receiver;
};

}  // namespace tgstore
