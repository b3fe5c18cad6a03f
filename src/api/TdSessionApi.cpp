#include <absl/log/log.h>
#include <absl/strings/match.h>
#include <absl/strings/str_join.h>
#include <absl/strings/strip.h>
#include <fmt/format.h>

#include <tgstore/Errors.hpp>
#include <tgstore/api/TdSessionApi.hpp>
#include <vector>

namespace td_api = td::td_api;

namespace tgstore {

namespace {

constexpr std::int32_t kTdLogVerbosity = 1;
constexpr double kReceiveTimeoutSec = 1.0;
constexpr std::chrono::seconds kCloseTimeout{10};
constexpr std::int32_t kDownloadPriority = 1;
constexpr std::string_view kDeviceModel = "TgStore";
constexpr std::string_view kApplicationVersion = "1.0";

bool isInviteLink(std::string_view target) {
    return absl::StrContains(target, "/joinchat/") ||
           absl::StrContains(target, "t.me/+") ||
           absl::StartsWith(target, "tg://join");
}

// Reduces @name and t.me/name links to the bare public username.
std::string usernameOf(std::string_view target) {
    absl::ConsumePrefix(&target, "https://");
    absl::ConsumePrefix(&target, "http://");
    absl::ConsumePrefix(&target, "t.me/");
    absl::ConsumePrefix(&target, "@");
    return std::string(target);
}

absl::Status fromTdError(const td_api::error& error) {
    const std::string text =
        fmt::format("TDLib error {}: {}", error.code_, error.message_);
    if (error.code_ == 401) {
        return ConfigurationError(text);
    }
    if (error.code_ == 404 ||
        absl::StrContains(error.message_, "not found") ||
        absl::StrContains(error.message_, "NOT_FOUND") ||
        absl::StrContains(error.message_, "USERNAME_NOT_OCCUPIED") ||
        absl::StrContains(error.message_, "USERNAME_INVALID") ||
        absl::StrContains(error.message_, "Invalid remote file")) {
        return NotFoundError(text);
    }
    return TransportError(text);
}

}  // namespace

TdSessionApi::TdSessionApi(Options options) : _options(std::move(options)) {}

TdSessionApi::~TdSessionApi() { disconnect_impl(); }

void TdSessionApi::post(Function function) {
    _manager->send(_clientId, _nextRequestId++, std::move(function));
}

absl::StatusOr<TdSessionApi::Object> TdSessionApi::request(
    Function function, const Deadline deadline) {
    if (!_manager) {
        return TransportError("Session is not connected");
    }
    const std::uint64_t requestId = _nextRequestId++;
    std::future<Object> response;
    {
        const std::lock_guard<std::mutex> lock(_mutex);
        response = _pending[requestId].get_future();
    }
    _manager->send(_clientId, requestId, std::move(function));

    if (response.wait_until(deadline) != std::future_status::ready) {
        const std::lock_guard<std::mutex> lock(_mutex);
        _pending.erase(requestId);
        return TimeoutError("Session request timed out");
    }
    Object object = response.get();
    if (!object) {
        return TransportError("Session closed while waiting for a response");
    }
    if (object->get_id() == td_api::error::ID) {
        const auto error = td::move_tl_object_as<td_api::error>(object);
        return fromTdError(*error);
    }
    return object;
}

template <typename T>
absl::StatusOr<td_api::object_ptr<T>> TdSessionApi::call(
    Function function, const Deadline deadline) {
    auto object = request(std::move(function), deadline);
    if (!object.ok()) {
        return object.status();
    }
    if ((*object)->get_id() != T::ID) {
        LOG(ERROR) << "Unexpected TDLib response: "
                   << td_api::to_string(*object);
        return TransportError("Unexpected response from session");
    }
    return td::move_tl_object_as<T>(*object);
}

void TdSessionApi::receiveLoop(const std::stop_token& token) {
    while (!token.stop_requested()) {
        auto response = _manager->receive(kReceiveTimeoutSec);
        if (!response.object || response.client_id != _clientId) {
            continue;
        }
        if (response.request_id == 0) {
            onUpdate(std::move(response.object));
            continue;
        }
        std::unique_lock<std::mutex> lock(_mutex);
        auto it = _pending.find(response.request_id);
        if (it == _pending.end()) {
            lock.unlock();
            if (response.object->get_id() == td_api::error::ID) {
                LOG(WARNING) << "TDLib request failed: "
                             << td_api::to_string(response.object);
            }
            continue;
        }
        auto promise = std::move(it->second);
        _pending.erase(it);
        if (response.object->get_id() == td_api::message::ID) {
            // Registered here so the send update, which follows on this
            // thread, finds a waiter.
            const auto& message =
                static_cast<const td_api::message&>(*response.object);
            if (message.sending_state_ &&
                message.sending_state_->get_id() ==
                    td_api::messageSendingStatePending::ID) {
                _sendOutcomes.expect({message.chat_id_, message.id_});
            }
        }
        lock.unlock();
        promise.set_value(std::move(response.object));
    }
}

void TdSessionApi::onUpdate(Object update) {
    switch (update->get_id()) {
        case td_api::updateAuthorizationState::ID: {
            auto state =
                td::move_tl_object_as<td_api::updateAuthorizationState>(update);
            onAuthorizationState(std::move(state->authorization_state_));
            break;
        }
        case td_api::updateMessageSendSucceeded::ID: {
            auto sent =
                td::move_tl_object_as<td_api::updateMessageSendSucceeded>(
                    update);
            const PendingSend key{sent->message_->chat_id_,
                                  sent->old_message_id_};
            const std::lock_guard<std::mutex> lock(_mutex);
            if (!_sendOutcomes.complete(
                    key, SendOutcome{std::move(sent->message_), {}})) {
                DLOG(INFO) << "Ignoring send result of message " << key.second;
            }
            _cv.notify_all();
            break;
        }
        case td_api::updateMessageSendFailed::ID: {
            auto failed =
                td::move_tl_object_as<td_api::updateMessageSendFailed>(update);
            LOG(ERROR) << "Message send failed: " << td_api::to_string(failed);
            const PendingSend key{failed->message_->chat_id_,
                                  failed->old_message_id_};
            const std::lock_guard<std::mutex> lock(_mutex);
            _sendOutcomes.complete(
                key, SendOutcome{nullptr, "the server rejected the upload"});
            _cv.notify_all();
            break;
        }
        default:
            break;
    }
}

void TdSessionApi::onAuthorizationState(
    td_api::object_ptr<td_api::AuthorizationState> state) {
    AuthState next = AuthState::Waiting;
    switch (state->get_id()) {
        case td_api::authorizationStateWaitTdlibParameters::ID: {
            auto parameters = td_api::make_object<td_api::setTdlibParameters>();
            parameters->database_directory_ = _options.sessionDir.string();
            parameters->files_directory_ =
                (_options.sessionDir / "files").string();
            parameters->use_file_database_ = true;
            parameters->use_chat_info_database_ = true;
            parameters->use_message_database_ = false;
            parameters->use_secret_chats_ = false;
            parameters->api_id_ = _options.apiId;
            parameters->api_hash_ = _options.apiHash;
            parameters->system_language_code_ = "en";
            parameters->device_model_ = std::string(kDeviceModel);
            parameters->application_version_ =
                std::string(kApplicationVersion);
            post(std::move(parameters));
            return;
        }
        case td_api::authorizationStateReady::ID:
            next = AuthState::Ready;
            break;
        case td_api::authorizationStateClosed::ID:
            next = AuthState::Closed;
            break;
        case td_api::authorizationStateClosing::ID:
        case td_api::authorizationStateLoggingOut::ID:
            return;
        default:
            // Phone number, code, password and the like: a login is needed.
            LOG(WARNING) << "Session requires interactive login: "
                         << td_api::to_string(state);
            next = AuthState::Unauthorized;
            break;
    }
    const std::lock_guard<std::mutex> lock(_mutex);
    _authState = next;
    _cv.notify_all();
}

absl::Status TdSessionApi::connect_impl() {
    if (_manager) {
        disconnect_impl();
    }
    td::ClientManager::execute(
        td_api::make_object<td_api::setLogVerbosityLevel>(kTdLogVerbosity));
    _manager = std::make_unique<td::ClientManager>();
    _clientId = _manager->create_client_id();
    {
        const std::lock_guard<std::mutex> lock(_mutex);
        _authState = AuthState::Waiting;
    }
    _receiver = std::jthread(
        [this](const std::stop_token& token) { receiveLoop(token); });
    // Any request starts the client.
    post(td_api::make_object<td_api::getOption>("version"));

    AuthState state = AuthState::Waiting;
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait_until(lock, requestDeadline(), [this] {
            return _authState != AuthState::Waiting;
        });
        state = _authState;
    }
    switch (state) {
        case AuthState::Ready:
            LOG(INFO) << "Session authorized from "
                      << _options.sessionDir.string();
            return absl::OkStatus();
        case AuthState::Unauthorized:
            disconnect_impl();
            return ConfigurationError(fmt::format(
                "Session in {} is not authorized; complete the login first",
                _options.sessionDir.string()));
        case AuthState::Waiting:
            disconnect_impl();
            return TransportError("Timed out waiting for the session");
        case AuthState::Closed:
            disconnect_impl();
            return TransportError("Session closed during startup");
    }
    return TransportError("Unknown session state");
}

void TdSessionApi::disconnect_impl() {
    if (!_manager) {
        return;
    }
    bool open = false;
    {
        const std::lock_guard<std::mutex> lock(_mutex);
        open = _authState != AuthState::Closed;
    }
    if (open) {
        post(td_api::make_object<td_api::close>());
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_cv.wait_for(lock, kCloseTimeout, [this] {
                return _authState == AuthState::Closed;
            })) {
            LOG(WARNING) << "Session did not close in time";
        }
    }
    _receiver.request_stop();
    if (_receiver.joinable()) {
        _receiver.join();
    }
    {
        const std::lock_guard<std::mutex> lock(_mutex);
        for (auto& [id, promise] : _pending) {
            promise.set_value(nullptr);
        }
        _pending.clear();
        _sendOutcomes.clear();
        _authState = AuthState::Closed;
    }
    _manager.reset();
    LOG(INFO) << "Session disconnected";
}

absl::StatusOr<AccountInfo> TdSessionApi::getMe_impl() {
    auto me = call<td_api::user>(td_api::make_object<td_api::getMe>(),
                                 requestDeadline());
    if (!me.ok()) {
        return me.status();
    }
    AccountInfo info;
    info.id = (*me)->id_;
    info.phoneNumber = (*me)->phone_number_;
    if ((*me)->usernames_ && !(*me)->usernames_->active_usernames_.empty()) {
        info.username = (*me)->usernames_->active_usernames_.front();
    }
    return info;
}

absl::StatusOr<td_api::object_ptr<td_api::chat>> TdSessionApi::lookupChat(
    const ChatIdentifier& chat, const Deadline deadline) {
    if (const auto* id = std::get_if<ChatId>(&chat)) {
        return call<td_api::chat>(td_api::make_object<td_api::getChat>(*id),
                                  deadline);
    }
    const auto& target = std::get<std::string>(chat);
    if (isInviteLink(target)) {
        auto info = call<td_api::chatInviteLinkInfo>(
            td_api::make_object<td_api::checkChatInviteLink>(target),
            deadline);
        if (!info.ok()) {
            return info.status();
        }
        if ((*info)->chat_id_ == 0) {
            return NotFoundError(
                fmt::format("Not a member of the chat behind {}", target));
        }
        return call<td_api::chat>(
            td_api::make_object<td_api::getChat>((*info)->chat_id_), deadline);
    }
    return call<td_api::chat>(
        td_api::make_object<td_api::searchPublicChat>(usernameOf(target)),
        deadline);
}

absl::StatusOr<ChatInfo> TdSessionApi::getChat_impl(
    const ChatIdentifier& chat) {
    auto found = lookupChat(chat, requestDeadline());
    if (!found.ok()) {
        return found.status();
    }
    return ChatInfo{(*found)->id_, (*found)->title_};
}

absl::Status TdSessionApi::joinChat_impl(const std::string_view target) {
    if (isInviteLink(target)) {
        return call<td_api::chat>(
                   td_api::make_object<td_api::joinChatByInviteLink>(
                       std::string(target)),
                   requestDeadline())
            .status();
    }
    auto chat = lookupChat(std::string(target), requestDeadline());
    if (!chat.ok()) {
        return chat.status();
    }
    return call<td_api::ok>(td_api::make_object<td_api::joinChat>((*chat)->id_),
                            requestDeadline())
        .status();
}

absl::StatusOr<TdSessionApi::SendOutcome> TdSessionApi::awaitSendOutcome(
    const PendingSend& key, const Deadline deadline) {
    std::unique_lock<std::mutex> lock(_mutex);
    const bool done = _cv.wait_until(lock, deadline, [this, &key] {
        return _sendOutcomes.ready(key) || _authState == AuthState::Closed;
    });
    auto outcome = _sendOutcomes.take(key);
    if (!outcome) {
        return done ? TransportError("Session closed during upload")
                    : TimeoutError("Upload did not finish before the deadline");
    }
    return std::move(*outcome);
}

absl::StatusOr<SentDocument> TdSessionApi::sendDocument_impl(
    const ChatIdentifier& chat, const std::filesystem::path& file,
    const std::string_view filename, const std::string_view contentType,
    const Deadline deadline) {
    std::int64_t chatId = 0;
    if (const auto* id = std::get_if<ChatId>(&chat)) {
        chatId = *id;
    } else {
        auto found = lookupChat(chat, deadline);
        if (!found.ok()) {
            return found.status();
        }
        chatId = (*found)->id_;
    }
    DLOG(INFO) << fmt::format("Sending {} as {} ({})", file.string(),
                              filename, contentType);

    auto content = td_api::make_object<td_api::inputMessageDocument>();
    content->document_ =
        td_api::make_object<td_api::inputFileLocal>(file.string());
    auto send = td_api::make_object<td_api::sendMessage>();
    send->chat_id_ = chatId;
    send->input_message_content_ = std::move(content);

    auto pending = call<td_api::message>(std::move(send), deadline);
    if (!pending.ok()) {
        return pending.status();
    }
    const PendingSend key{(*pending)->chat_id_, (*pending)->id_};
    auto outcome = awaitSendOutcome(key, deadline);
    if (!outcome.ok()) {
        if (errorKindOf(outcome.status()) == ErrorKind::kTimeout) {
            // Deleting the pending message cancels its upload.
            LOG(WARNING) << "Upload timed out, cancelling message "
                         << key.second;
            post(td_api::make_object<td_api::deleteMessages>(
                key.first, std::vector<std::int64_t>{key.second}, true));
        }
        return outcome.status();
    }
    if (!outcome->message) {
        return TransportError(
            fmt::format("Sending {} failed: {}", filename, outcome->failure));
    }

    const auto& message = outcome->message;
    SentDocument sent;
    sent.chatId = message->chat_id_;
    sent.messageId = message->id_;
    if (message->content_ &&
        message->content_->get_id() == td_api::messageDocument::ID) {
        const auto& document =
            static_cast<const td_api::messageDocument&>(*message->content_);
        const auto& remoteFile = document.document_->document_;
        sent.size = remoteFile->size_ != 0 ? remoteFile->size_
                                           : remoteFile->expected_size_;
        if (remoteFile->remote_) {
            sent.remoteFileId = remoteFile->remote_->id_;
        }
    }
    return sent;
}

absl::StatusOr<SpoolFile> TdSessionApi::downloadToSpool(
    const std::int32_t fileId, std::string name) {
    auto downloaded = call<td_api::file>(
        td_api::make_object<td_api::downloadFile>(fileId, kDownloadPriority, 0,
                                                  0, true),
        Clock::now() + _options.transferTimeout);
    if (!downloaded.ok()) {
        return downloaded.status();
    }
    const auto& local = (*downloaded)->local_;
    if (!local || !local->is_downloading_completed_) {
        return TransportError("Session download did not complete");
    }
    const std::filesystem::path cached(local->path_);
    if (name.empty()) {
        name = cached.filename().string();
    }
    auto spool = SpoolFile::copyFrom(cached, name);

    // The session library keeps its own copy; it is not needed any more.
    if (auto removed = call<td_api::ok>(
            td_api::make_object<td_api::deleteFile>(fileId), requestDeadline());
        !removed.ok()) {
        LOG(WARNING) << "Failed to delete cached file " << cached.string()
                     << ": " << removed.status();
    }
    return spool;
}

absl::StatusOr<SpoolFile> TdSessionApi::downloadMessageDocument_impl(
    const ChatId chat, const MessageId message) {
    // getMessage needs the chat to be known to the client.
    if (auto known = lookupChat(chat, requestDeadline()); !known.ok()) {
        return known.status();
    }
    auto found = call<td_api::message>(
        td_api::make_object<td_api::getMessage>(chat, message),
        requestDeadline());
    if (!found.ok()) {
        return found.status();
    }
    if (!(*found)->content_ ||
        (*found)->content_->get_id() != td_api::messageDocument::ID) {
        return NotFoundError(fmt::format(
            "Message {} in chat {} carries no document", message, chat));
    }
    const auto& document =
        static_cast<const td_api::messageDocument&>(*(*found)->content_);
    return downloadToSpool(document.document_->document_->id_,
                           document.document_->file_name_);
}

absl::StatusOr<SpoolFile> TdSessionApi::downloadRemoteFile_impl(
    const std::string_view remoteFileId) {
    auto file = call<td_api::file>(
        td_api::make_object<td_api::getRemoteFile>(std::string(remoteFileId),
                                                   nullptr),
        requestDeadline());
    if (!file.ok()) {
        return file.status();
    }
    return downloadToSpool((*file)->id_, {});
}

}  // namespace tgstore
