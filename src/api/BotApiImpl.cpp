#include <absl/log/log.h>
#include <absl/strings/match.h>
#include <fmt/format.h>

#include <tgstore/Errors.hpp>
#include <tgstore/api/BotApiImpl.hpp>
#include <tgstore/api/CurlDownloadStream.hpp>
#include <utility>

#include "tgbot/net/CurlHttpClient.h"

namespace tgstore {

namespace {

constexpr std::string_view kDefaultContentType = "application/octet-stream";

// The remote diagnostic is kept in the message, the category in the code.
absl::Status handleTgBotApiEx(const TgBot::TgException& ex,
                              std::string_view what) {
    LOG(ERROR) << fmt::format("TgBotAPI exception during {}: {}", what,
                              ex.what());
    if (ex.errorCode == TgBot::TgException::ErrorCode::BadRequest &&
        (absl::StrContains(ex.what(), "invalid file_id") ||
         absl::StrContains(ex.what(), "file not found") ||
         absl::StrContains(ex.what(), "wrong file_id"))) {
        return NotFoundError(ex.what());
    }
    return TransportError(fmt::format("{} failed: {}", what, ex.what()));
}

boost::variant<std::int64_t, std::string> toApiChatId(
    const ChatIdentifier& chat) {
    if (const auto* id = std::get_if<ChatId>(&chat)) {
        return *id;
    }
    return std::get<std::string>(chat);
}

}  // namespace

BotApiImpl::BotApiImpl(const std::string_view token,
                       const std::chrono::seconds httpTimeout)
    : _token(token),
      _httpTimeout(httpTimeout),
      _bot(std::string(token),
           std::make_unique<TgBot::CurlHttpClient>(httpTimeout)) {
    if (auto status = CurlDownloadStream::initGlobal(); !status.ok()) {
        LOG(WARNING) << "CDN downloads will fail: " << status;
    }
}

absl::StatusOr<BotDocument> BotApiImpl::sendDocument_impl(
    const ChatIdentifier& chat, const std::filesystem::path& file,
    const std::string_view filename, const std::string_view contentType) {
    TgBot::Message::Ptr message;
    try {
        auto document = TgBot::InputFile::fromFile(
            file.string(), std::string(contentType.empty() ? kDefaultContentType
                                                           : contentType));
        document->fileName = std::string(filename);
        message = getApi().sendDocument(toApiChatId(chat), document);
    } catch (const TgBot::TgException& ex) {
        return handleTgBotApiEx(ex, "sendDocument");
    } catch (const std::exception& ex) {
        LOG(ERROR) << "sendDocument failed: " << ex.what();
        return TransportError(fmt::format("sendDocument failed: {}", ex.what()));
    }
    if (!message || !message->document) {
        LOG(ERROR) << "sendDocument returned no document";
        return TransportError("Bot API response did not contain a document");
    }
    BotDocument result;
    result.fileId = message->document->fileId;
    result.size = message->document->fileSize.value_or(0);
    if (result.fileId.empty()) {
        return TransportError("Bot API response carried an empty file id");
    }
    LOG(INFO) << fmt::format("Sent document {} to {} as {}", filename, chat,
                             result.fileId);
    return result;
}

absl::StatusOr<BotFileInfo> BotApiImpl::getFile_impl(
    const std::string_view fileId) {
    TgBot::File::Ptr file;
    try {
        file = getApi().getFile(std::string(fileId));
    } catch (const TgBot::TgException& ex) {
        return handleTgBotApiEx(ex, "getFile");
    } catch (const std::exception& ex) {
        LOG(ERROR) << "getFile failed: " << ex.what();
        return TransportError(fmt::format("getFile failed: {}", ex.what()));
    }
    if (!file) {
        LOG(INFO) << "File " << fileId << " not found in Telegram servers.";
        return NotFoundError(fmt::format("File {} not found", fileId));
    }
    if (!file->filePath) {
        LOG(INFO) << "Cannot retrieve filePath";
        return NotFoundError(
            fmt::format("File {} has no download path", fileId));
    }
    return BotFileInfo{*file->filePath, file->fileSize.value_or(0)};
}

absl::StatusOr<std::unique_ptr<ByteStream>> BotApiImpl::openFile_impl(
    const std::string_view remotePath) {
    auto stream = CurlDownloadStream::open(
        fmt::format("{}{}/{}", kFileEndpoint, _token, remotePath),
        _httpTimeout);
    if (!stream.ok()) {
        return stream.status();
    }
    return std::unique_ptr<ByteStream>(std::move(*stream));
}

}  // namespace tgstore
