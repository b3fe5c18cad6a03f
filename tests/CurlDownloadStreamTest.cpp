#include <gtest/gtest.h>
#include <unistd.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <tgstore/Errors.hpp>
#include <tgstore/api/CurlDownloadStream.hpp>
#include <vector>

#include "TestSources.hpp"

using namespace std::chrono_literals;
using tgstore::ByteStream;
using tgstore::CurlDownloadStream;

class CurlDownloadStreamTest : public ::testing::Test {
   protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               ("tgstore-curl-test-" + std::to_string(::getpid()));
        payload.resize(300 * 1024);
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = PatternByteSource::at(i);
        }
        std::ofstream ofs(path, std::ios::binary);
        ofs.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    }

    void TearDown() override { std::filesystem::remove(path); }

    [[nodiscard]] std::string url() const { return "file://" + path.string(); }

    std::filesystem::path path;
    std::string payload;
};

TEST_F(CurlDownloadStreamTest, ReadsInSmallPieces) {
    auto stream = CurlDownloadStream::open(url(), 10s);
    ASSERT_TRUE(stream.ok()) << stream.status();

    std::string received;
    std::array<char, 1024> buffer{};
    while (true) {
        auto n = (*stream)->read(buffer);
        ASSERT_TRUE(n.ok()) << n.status();
        ASSERT_LE(*n, buffer.size());
        if (*n == 0) {
            break;
        }
        received.append(buffer.data(), *n);
    }
    EXPECT_EQ(received.size(), payload.size());
    EXPECT_TRUE(received == payload);

    auto again = (*stream)->read(buffer);
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(*again, 0);
}

TEST_F(CurlDownloadStreamTest, LargeReadsAreCappedAtOneChunk) {
    auto stream = CurlDownloadStream::open(url(), 10s);
    ASSERT_TRUE(stream.ok()) << stream.status();

    std::vector<char> buffer(4 * ByteStream::kChunkSize);
    std::string received;
    while (true) {
        auto n = (*stream)->read(buffer);
        ASSERT_TRUE(n.ok()) << n.status();
        ASSERT_LE(*n, ByteStream::kChunkSize);
        if (*n == 0) {
            break;
        }
        received.append(buffer.data(), *n);
    }
    EXPECT_TRUE(received == payload);
}

TEST_F(CurlDownloadStreamTest, AbortStopsTheStream) {
    auto stream = CurlDownloadStream::open(url(), 10s);
    ASSERT_TRUE(stream.ok()) << stream.status();
    std::array<char, 1024> buffer{};
    ASSERT_TRUE((*stream)->read(buffer).ok());
    (*stream)->abort();
    auto n = (*stream)->read(buffer);
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(*n, 0);
}

TEST_F(CurlDownloadStreamTest, MissingFileIsNotFound) {
    auto stream = CurlDownloadStream::open(url() + ".missing", 10s);
    ASSERT_TRUE(stream.ok()) << stream.status();
    std::array<char, 1024> buffer{};
    auto n = (*stream)->read(buffer);
    ASSERT_FALSE(n.ok());
    EXPECT_EQ(tgstore::errorKindOf(n.status()), tgstore::ErrorKind::kNotFound);
}

TEST(CurlDownloadStreamRedactTest, HidesBotToken) {
    EXPECT_EQ(CurlDownloadStream::redact(
                  "https://api.telegram.org/file/bot123:SECRET/documents/a.txt"),
              "https://api.telegram.org/file/bot<redacted>/documents/a.txt");
    EXPECT_EQ(CurlDownloadStream::redact("https://example.com/plain"),
              "https://example.com/plain");
    EXPECT_EQ(CurlDownloadStream::redact("https://host/bot123:SECRET"),
              "https://host/bot<redacted>");
}
