#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tgstore/Errors.hpp>
#include <tgstore/StorageClient.hpp>

#include "TestSources.hpp"
#include "mocks/BotApi.hpp"
#include "mocks/SessionApi.hpp"

using namespace std::chrono_literals;
using testing::_;
using testing::Eq;
using testing::NiceMock;
using testing::Return;
using tgstore::BotDocument;
using tgstore::BotFileInfo;
using tgstore::BotTransport;
using tgstore::ChatId;
using tgstore::ChatIdentifier;
using tgstore::ErrorKind;
using tgstore::errorKindOf;
using tgstore::SessionTransport;
using tgstore::StorageClient;
using tgstore::StorageReference;

namespace {
constexpr std::uint64_t kMiB = 1024 * 1024;
constexpr ChatId kChatId = -1001234567890;
}  // namespace

class BotStorageClientTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto mock = std::make_unique<MockBotApi>();
        api = mock.get();
        client = std::make_unique<StorageClient>(
            std::make_unique<BotTransport>(std::move(mock),
                                           ChatIdentifier{"-100777"}),
            30s, BotTransport::kMaxUploadBytes);
    }

    MockBotApi* api = nullptr;
    std::unique_ptr<StorageClient> client;
};

TEST_F(BotStorageClientTest, UploadsTenMegabytes) {
    EXPECT_CALL(*api, sendDocument_impl(_, _, Eq("ten.bin"), _))
        .WillOnce([](const ChatIdentifier&, const std::filesystem::path& file,
                     std::string_view, std::string_view)
                      -> absl::StatusOr<BotDocument> {
            return BotDocument{"ten-id", std::filesystem::file_size(file)};
        });

    PatternByteSource source(10 * kMiB);
    auto ref = client->upload(source, "ten.bin", "application/octet-stream");
    ASSERT_TRUE(ref.ok()) << ref.status();
    EXPECT_EQ(ref->externalId(), "ten-id");
    EXPECT_EQ(ref->name(), "ten.bin");
    EXPECT_EQ(ref->size(), 10 * kMiB);
    EXPECT_FALSE(ref->hasMessageRef());
}

TEST_F(BotStorageClientTest, SixtyMegabytesNeverReachTheTransport) {
    EXPECT_CALL(*api, sendDocument_impl(_, _, _, _)).Times(0);

    PatternByteSource source(60 * kMiB);
    auto ref = client->upload(source, "big.bin", "");
    ASSERT_FALSE(ref.ok());
    EXPECT_EQ(errorKindOf(ref.status()), ErrorKind::kSizeLimitExceeded);
    EXPECT_LT(source.bytesRead, 60 * kMiB);
}

TEST_F(BotStorageClientTest, OversizedHintFailsBeforeReading) {
    EXPECT_CALL(*api, sendDocument_impl(_, _, _, _)).Times(0);

    MemoryByteSource source("small");
    auto ref = client->upload(source, "big.bin", "", 60 * kMiB);
    ASSERT_FALSE(ref.ok());
    EXPECT_EQ(errorKindOf(ref.status()), ErrorKind::kSizeLimitExceeded);
    EXPECT_EQ(source.reads, 0);
}

TEST_F(BotStorageClientTest, TransportFailureIsReported) {
    EXPECT_CALL(*api, sendDocument_impl(_, _, _, _))
        .WillOnce(Return(tgstore::TransportError("502 Bad Gateway")));

    MemoryByteSource source("data");
    auto ref = client->upload(source, "a.bin", "");
    ASSERT_FALSE(ref.ok());
    EXPECT_EQ(errorKindOf(ref.status()), ErrorKind::kTransport);
}

TEST_F(BotStorageClientTest, RoundTrip) {
    std::string stored;
    EXPECT_CALL(*api, sendDocument_impl(_, _, _, _))
        .WillOnce([&stored](const ChatIdentifier&,
                            const std::filesystem::path& file,
                            std::string_view, std::string_view)
                      -> absl::StatusOr<BotDocument> {
            stored = readFile(file);
            return BotDocument{"rt-id", stored.size()};
        });
    EXPECT_CALL(*api, getFile_impl(Eq("rt-id")))
        .WillOnce(Return(BotFileInfo{"documents/file_1.txt", 11}));
    EXPECT_CALL(*api, openFile_impl(Eq("documents/file_1.txt")))
        .WillOnce([&stored](std::string_view)
                      -> absl::StatusOr<std::unique_ptr<tgstore::ByteStream>> {
            return std::make_unique<MemoryByteStream>(stored);
        });

    MemoryByteSource source("hello world", 3);
    auto ref = client->upload(source, "hello.txt", "text/plain");
    ASSERT_TRUE(ref.ok()) << ref.status();

    auto download = client->download(*ref);
    ASSERT_TRUE(download.ok()) << download.status();
    EXPECT_EQ(download->name, "hello.txt");
    EXPECT_EQ(download->size, 11);
    EXPECT_EQ(drainStream(*download->stream), "hello world");
}

TEST_F(BotStorageClientTest, DownloadNameFallsBackToRemotePath) {
    EXPECT_CALL(*api, getFile_impl(_))
        .WillOnce(Return(BotFileInfo{"documents/file_9.pdf", 3}));
    EXPECT_CALL(*api, openFile_impl(_))
        .WillOnce([](std::string_view)
                      -> absl::StatusOr<std::unique_ptr<tgstore::ByteStream>> {
            return std::make_unique<MemoryByteStream>("pdf");
        });

    auto download =
        client->download(StorageReference::forBot("id", "", 0));
    ASSERT_TRUE(download.ok()) << download.status();
    EXPECT_EQ(download->name, "file_9.pdf");
}

TEST_F(BotStorageClientTest, UnknownIdIsNotFound) {
    EXPECT_CALL(*api, getFile_impl(_))
        .WillOnce(Return(tgstore::NotFoundError("wrong file_id")));
    EXPECT_CALL(*api, openFile_impl(_)).Times(0);

    auto download = client->download(StorageReference::forBot("gone", "x", 1));
    ASSERT_FALSE(download.ok());
    EXPECT_EQ(errorKindOf(download.status()), ErrorKind::kNotFound);
}

TEST_F(BotStorageClientTest, DiagnoseNeedsSessionMode) {
    EXPECT_EQ(client->mode(), tgstore::TransportMode::Bot);
    EXPECT_EQ(client->sessionState(), std::nullopt);
    auto diagnostics = client->diagnose();
    ASSERT_FALSE(diagnostics.ok());
    EXPECT_EQ(errorKindOf(diagnostics.status()), ErrorKind::kConfiguration);
}

class SessionStorageClientTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto mock = std::make_unique<NiceMock<MockSessionApi>>();
        api = mock.get();
        ON_CALL(*api, connect_impl()).WillByDefault(Return(absl::OkStatus()));
        ON_CALL(*api, getChat_impl(_))
            .WillByDefault(Return(tgstore::ChatInfo{kChatId, "Storage"}));
        client = std::make_unique<StorageClient>(
            std::make_unique<SessionTransport>(std::move(mock),
                                               ChatIdentifier{kChatId}),
            30s, std::nullopt);
    }

    NiceMock<MockSessionApi>* api = nullptr;
    std::unique_ptr<StorageClient> client;
};

TEST_F(SessionStorageClientTest, StartsLazily) {
    EXPECT_EQ(client->mode(), tgstore::TransportMode::Session);
    EXPECT_EQ(client->sessionState(), SessionTransport::State::Unstarted);
}

TEST_F(SessionStorageClientTest, RoundTripPrefersMessageReference) {
    std::string stored;
    EXPECT_CALL(*api, sendDocument_impl(Eq(ChatIdentifier{kChatId}), _,
                                        Eq("report.csv"), Eq("text/csv"), _))
        .WillOnce([&stored](const ChatIdentifier&,
                            const std::filesystem::path& file,
                            std::string_view, std::string_view,
                            tgstore::Deadline)
                      -> absl::StatusOr<tgstore::SentDocument> {
            stored = readFile(file);
            return tgstore::SentDocument{kChatId, 314, "AgACremote",
                                         stored.size()};
        });
    EXPECT_CALL(*api, downloadMessageDocument_impl(kChatId, 314))
        .WillOnce([&stored](ChatId, tgstore::MessageId)
                      -> absl::StatusOr<tgstore::SpoolFile> {
            return makeSpool(stored, "report.csv");
        });
    EXPECT_CALL(*api, downloadRemoteFile_impl(_)).Times(0);

    MemoryByteSource source("a,b,c\n1,2,3\n");
    auto ref = client->upload(source, "report.csv", "text/csv");
    ASSERT_TRUE(ref.ok()) << ref.status();
    EXPECT_EQ(client->sessionState(), SessionTransport::State::Ready);
    EXPECT_EQ(ref->chatRef(), "-1001234567890");
    EXPECT_EQ(ref->messageRef(), 314);
    EXPECT_EQ(ref->externalId(), "AgACremote");

    auto download = client->download(*ref);
    ASSERT_TRUE(download.ok()) << download.status();
    EXPECT_EQ(download->name, "report.csv");
    EXPECT_EQ(drainStream(*download->stream), "a,b,c\n1,2,3\n");
}

TEST_F(SessionStorageClientTest, ExternalIdIsTheFallback) {
    EXPECT_CALL(*api, downloadMessageDocument_impl(_, _)).Times(0);
    EXPECT_CALL(*api, downloadRemoteFile_impl(Eq("AgACremote")))
        .WillOnce([](std::string_view) -> absl::StatusOr<tgstore::SpoolFile> {
            return makeSpool("legacy");
        });

    auto download = client->download(StorageReference::fromRecord(
        "AgACremote", "legacy.txt", 6, std::nullopt, std::nullopt));
    ASSERT_TRUE(download.ok()) << download.status();
    EXPECT_EQ(drainStream(*download->stream), "legacy");
}

TEST_F(SessionStorageClientTest, SizeLimitAppliesWhenConfigured) {
    auto mock = std::make_unique<NiceMock<MockSessionApi>>();
    EXPECT_CALL(*mock, sendDocument_impl(_, _, _, _, _)).Times(0);
    StorageClient limited(
        std::make_unique<SessionTransport>(std::move(mock),
                                           ChatIdentifier{kChatId}),
        30s, 1024);

    PatternByteSource source(4096);
    auto ref = limited.upload(source, "a.bin", "");
    ASSERT_FALSE(ref.ok());
    EXPECT_EQ(errorKindOf(ref.status()), ErrorKind::kSizeLimitExceeded);
}

TEST_F(SessionStorageClientTest, ShutdownReturnsToUnstarted) {
    EXPECT_CALL(*api, getMe_impl())
        .WillOnce(Return(tgstore::AccountInfo{1, "me", ""}));
    ASSERT_TRUE(client->diagnose().ok());
    EXPECT_EQ(client->sessionState(), SessionTransport::State::Ready);
    client->shutdown();
    EXPECT_EQ(client->sessionState(), SessionTransport::State::Unstarted);
}
