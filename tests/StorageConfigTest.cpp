#include <gtest/gtest.h>

#include <ConfigManager.hpp>
#include <Env.hpp>
#include <tgstore/BotTransport.hpp>
#include <tgstore/Errors.hpp>
#include <tgstore/StorageConfig.hpp>

#include "GetCommandLine.hpp"

using tgstore::ConfigManager;
using tgstore::Env;
using tgstore::ErrorKind;
using tgstore::errorKindOf;
using tgstore::StorageConfig;
using tgstore::TransportMode;

class StorageConfigTest : public ::testing::Test {
   protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const auto& entry : ConfigManager::kConfigMap) {
            Env()[entry.name].clear();
        }
    }

    static absl::StatusOr<StorageConfig> load(
        std::initializer_list<std::string> args) {
        FakeArgv argv(args);
        const ConfigManager config(argv.commandLine(), {});
        return StorageConfig::load(config);
    }
};

TEST_F(StorageConfigTest, BotModeIsTheDefault) {
    auto config = load({"tgstore", "-t", "123:abc", "--CHAT_ID=-100777"});
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->mode, TransportMode::Bot);
    EXPECT_EQ(config->token, "123:abc");
    EXPECT_EQ(config->destination, tgstore::ChatIdentifier{"-100777"});
    EXPECT_EQ(config->uploadTimeout, StorageConfig::kDefaultUploadTimeout);
    EXPECT_EQ(config->sizeLimit(), tgstore::BotTransport::kMaxUploadBytes);
}

TEST_F(StorageConfigTest, BotModeWithoutTokenIsRejected) {
    auto config = load({"tgstore", "--CHAT_ID=-100777"});
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(errorKindOf(config.status()), ErrorKind::kConfiguration);
    EXPECT_NE(config.status().message().find("TOKEN"), std::string_view::npos);
}

TEST_F(StorageConfigTest, SessionModeNeedsCredentials) {
    auto config = load({"tgstore", "-m", "session", "-c", "@storage"});
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(errorKindOf(config.status()), ErrorKind::kConfiguration);
    const auto message = config.status().message();
    EXPECT_NE(message.find("API_ID"), std::string_view::npos);
    EXPECT_NE(message.find("API_HASH"), std::string_view::npos);
    EXPECT_NE(message.find("SESSION_DIR"), std::string_view::npos);
}

TEST_F(StorageConfigTest, SessionModeFromEnvironment) {
    Env()["UPLOAD_MODE"] = "User";
    Env()["API_ID"] = "12345";
    Env()["API_HASH"] = "0123456789abcdef";
    Env()["SESSION_DIR"] = "/var/lib/tgstore";
    Env()["CHAT_ID"] = "@storage";
    Env()["SESSION_MAX_UPLOAD"] = "2000000000";
    Env()["UPLOAD_TIMEOUT_SECONDS"] = "60";

    auto config = load({"tgstore"});
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->mode, TransportMode::Session);
    EXPECT_EQ(config->apiId, 12345);
    EXPECT_EQ(config->sessionDir, "/var/lib/tgstore");
    EXPECT_EQ(config->uploadTimeout, std::chrono::seconds(60));
    EXPECT_EQ(config->sizeLimit(), 2000000000ULL);
}

TEST_F(StorageConfigTest, SessionModeIsUncappedByDefault) {
    auto config = load({"tgstore", "-m", "session", "--API_ID", "1",
                        "--API_HASH", "h", "-s", "/tmp/session", "-c", "1"});
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->sizeLimit(), std::nullopt);
}

TEST_F(StorageConfigTest, MissingDestinationIsRejected) {
    auto config = load({"tgstore", "-t", "123:abc"});
    ASSERT_FALSE(config.ok());
    EXPECT_NE(config.status().message().find("CHAT_ID"),
              std::string_view::npos);
}

TEST_F(StorageConfigTest, BadNumbersAreRejected) {
    EXPECT_EQ(errorKindOf(load({"tgstore", "-t", "x", "-c", "1",
                                "--UPLOAD_TIMEOUT_SECONDS=0"})
                              .status()),
              ErrorKind::kConfiguration);
    EXPECT_EQ(errorKindOf(load({"tgstore", "-t", "x", "-c", "1",
                                "--HTTP_TIMEOUT_SECONDS", "soon"})
                              .status()),
              ErrorKind::kConfiguration);
}

TEST_F(StorageConfigTest, UnknownModeIsRejected) {
    auto config = load({"tgstore", "-m", "carrier-pigeon", "-t", "x"});
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(errorKindOf(config.status()), ErrorKind::kConfiguration);
}

TEST(StorageConfigParseModeTest, ParseMode) {
    EXPECT_EQ(StorageConfig::parseMode("bot"), TransportMode::Bot);
    EXPECT_EQ(StorageConfig::parseMode(" SESSION "), TransportMode::Session);
    EXPECT_EQ(StorageConfig::parseMode("user"), TransportMode::Session);
    EXPECT_EQ(StorageConfig::parseMode("both"), std::nullopt);
}

TEST_F(StorageConfigTest, TimeoutsAreBounded) {
    const auto tooLong =
        std::to_string(StorageConfig::kMaxTimeout.count() + 1);
    auto upload = load({"tgstore", "-t", "x", "-c", "1",
                        "--UPLOAD_TIMEOUT_SECONDS", tooLong});
    ASSERT_FALSE(upload.ok());
    EXPECT_EQ(errorKindOf(upload.status()), ErrorKind::kConfiguration);

    auto http = load({"tgstore", "-t", "x", "-c", "1",
                      "--HTTP_TIMEOUT_SECONDS", "3000000"});
    ASSERT_FALSE(http.ok());
    EXPECT_EQ(errorKindOf(http.status()), ErrorKind::kConfiguration);

    auto atLimit =
        load({"tgstore", "-t", "x", "-c", "1", "--UPLOAD_TIMEOUT_SECONDS",
              std::to_string(StorageConfig::kMaxTimeout.count())});
    ASSERT_TRUE(atLimit.ok()) << atLimit.status();
    EXPECT_EQ(atLimit->uploadTimeout, StorageConfig::kMaxTimeout);
}
