#include <absl/log/log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_join.h>
#include <fmt/format.h>

#include <ConfigManager.hpp>
#include <tgstore/BotTransport.hpp>
#include <tgstore/Errors.hpp>
#include <tgstore/StorageConfig.hpp>
#include <vector>

namespace tgstore {

namespace {

using Configs = ConfigManager::Configs;

// Parses a strictly positive integer config, if set.
template <typename T>
absl::StatusOr<std::optional<T>> positiveOf(const ConfigManager& config,
                                            const Configs key) {
    const auto value = config.get(key);
    if (!value) {
        return std::nullopt;
    }
    T parsed{};
    if (!absl::SimpleAtoi(*value, &parsed) || parsed <= 0) {
        return ConfigurationError(
            fmt::format("{} must be a positive integer, got '{}'",
                        ConfigManager::nameOf(key), *value));
    }
    return parsed;
}

}  // namespace

std::optional<TransportMode> StorageConfig::parseMode(std::string_view value) {
    const std::string mode =
        absl::AsciiStrToLower(absl::StripAsciiWhitespace(value));
    if (mode == "bot") {
        return TransportMode::Bot;
    }
    if (mode == "session" || mode == "user") {
        return TransportMode::Session;
    }
    return std::nullopt;
}

absl::StatusOr<StorageConfig> StorageConfig::load(const ConfigManager& config) {
    StorageConfig result;

    if (const auto mode = config.get(Configs::UPLOAD_MODE); mode) {
        const auto parsed = parseMode(*mode);
        if (!parsed) {
            return ConfigurationError(fmt::format(
                "UPLOAD_MODE must be 'bot' or 'session', got '{}'", *mode));
        }
        result.mode = *parsed;
    }

    if (const auto chat = config.get(Configs::CHAT_ID); chat) {
        result.destination = std::string(absl::StripAsciiWhitespace(*chat));
    } else {
        result.destination = std::string();
    }
    result.token = config.get(Configs::TOKEN).value_or("");
    result.apiHash = config.get(Configs::API_HASH).value_or("");
    if (const auto dir = config.get(Configs::SESSION_DIR); dir) {
        result.sessionDir = *dir;
    }
    if (const auto logFile = config.get(Configs::LOG_FILE); logFile) {
        result.logFile = *logFile;
    }

    auto apiId = positiveOf<std::int32_t>(config, Configs::API_ID);
    if (!apiId.ok()) {
        return apiId.status();
    }
    result.apiId = apiId->value_or(0);

    auto uploadTimeout =
        positiveOf<std::int64_t>(config, Configs::UPLOAD_TIMEOUT_SECONDS);
    if (!uploadTimeout.ok()) {
        return uploadTimeout.status();
    }
    if (*uploadTimeout) {
        result.uploadTimeout = std::chrono::seconds(**uploadTimeout);
    }

    auto httpTimeout =
        positiveOf<std::int64_t>(config, Configs::HTTP_TIMEOUT_SECONDS);
    if (!httpTimeout.ok()) {
        return httpTimeout.status();
    }
    if (*httpTimeout) {
        result.httpTimeout = std::chrono::seconds(**httpTimeout);
    }

    auto maxUpload =
        positiveOf<std::uint64_t>(config, Configs::SESSION_MAX_UPLOAD);
    if (!maxUpload.ok()) {
        return maxUpload.status();
    }
    result.sessionMaxUpload = *maxUpload;

    if (auto status = result.validate(); !status.ok()) {
        return status;
    }
    LOG(INFO) << fmt::format("Configured {} mode, destination {}", result.mode,
                             result.destination);
    return result;
}

absl::Status StorageConfig::validate() const {
    std::vector<std::string_view> missing;
    const auto* destinationStr = std::get_if<std::string>(&destination);
    if (destinationStr != nullptr && destinationStr->empty()) {
        missing.emplace_back(ConfigManager::nameOf(Configs::CHAT_ID));
    }
    switch (mode) {
        case TransportMode::Bot:
            if (token.empty()) {
                missing.emplace_back(ConfigManager::nameOf(Configs::TOKEN));
            }
            break;
        case TransportMode::Session:
            if (apiId <= 0) {
                missing.emplace_back(ConfigManager::nameOf(Configs::API_ID));
            }
            if (apiHash.empty()) {
                missing.emplace_back(ConfigManager::nameOf(Configs::API_HASH));
            }
            if (sessionDir.empty()) {
                missing.emplace_back(
                    ConfigManager::nameOf(Configs::SESSION_DIR));
            }
            break;
    }
    if (!missing.empty()) {
        return ConfigurationError(fmt::format("{} mode requires {}", mode,
                                              absl::StrJoin(missing, ", ")));
    }
    if (uploadTimeout.count() <= 0 || httpTimeout.count() <= 0) {
        return ConfigurationError("Timeouts must be positive");
    }
    if (uploadTimeout > kMaxTimeout || httpTimeout > kMaxTimeout) {
        return ConfigurationError(
            fmt::format("Timeouts must not exceed {} seconds",
                        kMaxTimeout.count()));
    }
    return absl::OkStatus();
}

std::optional<std::uint64_t> StorageConfig::sizeLimit() const {
    switch (mode) {
        case TransportMode::Bot:
            return BotTransport::kMaxUploadBytes;
        case TransportMode::Session:
            return sessionMaxUpload;
    }
    return std::nullopt;
}

}  // namespace tgstore
