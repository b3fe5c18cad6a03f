#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "Types.hpp"

namespace tgstore {

class ConfigManager;

/**
 * @brief Typed, validated process configuration for the storage client.
 *
 * Built once at startup. A transport selected without the credentials it
 * needs is rejected here with ConfigurationError, never per request.
 */
struct StorageConfig {
    static constexpr std::chrono::seconds kDefaultUploadTimeout{1800};
    static constexpr std::chrono::seconds kDefaultHttpTimeout{300};
    // Upper bound for both timeouts.
    static constexpr std::chrono::seconds kMaxTimeout{7 * 24 * 60 * 60};

    TransportMode mode = TransportMode::Bot;
    ChatIdentifier destination{std::string()};

    // Bot mode.
    std::string token;
    std::chrono::seconds httpTimeout = kDefaultHttpTimeout;

    // Session mode.
    std::int32_t apiId = 0;
    std::string apiHash;
    std::filesystem::path sessionDir;
    std::optional<std::uint64_t> sessionMaxUpload;

    std::chrono::seconds uploadTimeout = kDefaultUploadTimeout;
    std::optional<std::filesystem::path> logFile;

    /**
     * @brief Reads and validates the configuration.
     *
     * @return The configuration, or ConfigurationError naming the offending
     * or missing keys.
     */
    static absl::StatusOr<StorageConfig> load(const ConfigManager& config);

    // Checks that the selected mode has everything it needs.
    [[nodiscard]] absl::Status validate() const;

    // The size ceiling uploads are spooled under in the selected mode.
    [[nodiscard]] std::optional<std::uint64_t> sizeLimit() const;

    // Accepts "bot", "session" and its alias "user", in any case.
    static std::optional<TransportMode> parseMode(std::string_view value);
};

}  // namespace tgstore
