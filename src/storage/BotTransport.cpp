#include <absl/log/log.h>
#include <fmt/format.h>

#include <tgstore/BotTransport.hpp>
#include <tgstore/Errors.hpp>
#include <utility>

namespace tgstore {

BotTransport::BotTransport(std::unique_ptr<BotApi> api,
                           ChatIdentifier destination)
    : _api(std::move(api)), _destination(std::move(destination)) {}

absl::StatusOr<BotTransport::SendResult> BotTransport::send(
    const SpoolFile& spool, const std::string_view filename,
    const std::string_view contentType) const {
    LOG(INFO) << fmt::format("Uploading {} ({} bytes) to {} via bot API",
                             filename, spool.size(), _destination);
    auto document =
        _api->sendDocument(_destination, spool.path(), filename, contentType);
    if (!document.ok()) {
        return withContext(
            document.status(),
            fmt::format("Upload of {} ({} bytes) to {}", filename,
                        spool.size(), _destination));
    }
    // Older responses may omit the size; the spool knows it.
    const std::uint64_t size =
        document->size != 0 ? document->size : spool.size();
    return SendResult{std::move(document->fileId), size};
}

absl::StatusOr<BotFileInfo> BotTransport::fetchMetadata(
    const std::string_view externalId) const {
    auto info = _api->getFile(externalId);
    if (!info.ok()) {
        return withContext(info.status(),
                           fmt::format("Metadata lookup of {}", externalId));
    }
    DLOG(INFO) << fmt::format("File {} is at {} ({} bytes)", externalId,
                              info->remotePath, info->size);
    return info;
}

absl::StatusOr<std::unique_ptr<ByteStream>> BotTransport::openDownloadStream(
    const std::string_view remotePath) const {
    auto stream = _api->openFile(remotePath);
    if (!stream.ok()) {
        return withContext(stream.status(),
                           fmt::format("Download of {}", remotePath));
    }
    return stream;
}

}  // namespace tgstore
