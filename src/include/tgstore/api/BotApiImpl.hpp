#pragma once

#include <tgbot/tgbot.h>

#include <chrono>
#include <string>
#include <string_view>

#include <tgstore/BotApi.hpp>

namespace tgstore {

// Wraps TgBot::Api behind the BotApi interface. This class owns the Bot
// instance; nothing else gets to touch it.
class BotApiImpl : public BotApi {
   public:
    static constexpr std::string_view kFileEndpoint =
        "https://api.telegram.org/file/bot";

    // Constructor requires a bot token to create a Bot instance.
    BotApiImpl(std::string_view token, std::chrono::seconds httpTimeout);
    ~BotApiImpl() override = default;

   protected:
    absl::StatusOr<BotDocument> sendDocument_impl(
        const ChatIdentifier& chat, const std::filesystem::path& file,
        std::string_view filename, std::string_view contentType) override;
    absl::StatusOr<BotFileInfo> getFile_impl(std::string_view fileId) override;
    absl::StatusOr<std::unique_ptr<ByteStream>> openFile_impl(
        std::string_view remotePath) override;

   private:
    [[nodiscard]] const TgBot::Api& getApi() const { return _bot.getApi(); }

    std::string _token;
    std::chrono::seconds _httpTimeout;
    TgBot::Bot _bot;
};

}  // namespace tgstore
