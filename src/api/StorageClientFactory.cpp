#include <absl/log/log.h>
#include <fmt/format.h>

#include <tgstore/Errors.hpp>
#include <tgstore/StorageClient.hpp>
#include <tgstore/api/BotApiImpl.hpp>
#include <tgstore/api/TdSessionApi.hpp>
#include <utility>

namespace tgstore {

absl::StatusOr<std::unique_ptr<StorageClient>> StorageClient::create(
    const StorageConfig& config) {
    if (auto status = config.validate(); !status.ok()) {
        return status;
    }

    Transport transport;
    switch (config.mode) {
        case TransportMode::Bot: {
            std::unique_ptr<BotApi> api;
            try {
                api = std::make_unique<BotApiImpl>(config.token,
                                                   config.httpTimeout);
            } catch (const std::exception& ex) {
                LOG(ERROR) << "Cannot create bot client: " << ex.what();
                return ConfigurationError(
                    fmt::format("Cannot create bot client: {}", ex.what()));
            }
            transport = std::make_unique<BotTransport>(std::move(api),
                                                       config.destination);
            break;
        }
        case TransportMode::Session: {
            TdSessionApi::Options options;
            options.apiId = config.apiId;
            options.apiHash = config.apiHash;
            options.sessionDir = config.sessionDir;
            options.transferTimeout = config.uploadTimeout;
            transport = std::make_unique<SessionTransport>(
                std::make_unique<TdSessionApi>(std::move(options)),
                config.destination);
            break;
        }
    }
    return std::make_unique<StorageClient>(
        std::move(transport), config.uploadTimeout, config.sizeLimit());
}

}  // namespace tgstore
