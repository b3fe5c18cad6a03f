#include <gtest/gtest.h>
#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>
#include <tgstore/Errors.hpp>
#include <tgstore/TransferController.hpp>

#include "TestSources.hpp"

using namespace std::chrono_literals;
using tgstore::Clock;
using tgstore::ErrorKind;
using tgstore::errorKindOf;
using tgstore::FdByteSource;
using tgstore::Pipe;
using tgstore::StreamByteSource;
using tgstore::TransferController;

namespace {

// Number of spool directories currently in the temporary directory.
size_t countSpoolDirs() {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(
             std::filesystem::temp_directory_path())) {
        if (entry.path().filename().string().starts_with("tgstore-")) {
            ++count;
        }
    }
    return count;
}

}  // namespace

class TransferControllerTest : public ::testing::Test {
   protected:
    void SetUp() override { spoolDirsBefore = countSpoolDirs(); }

    void expectNoSpoolLeft() const {
        EXPECT_EQ(countSpoolDirs(), spoolDirsBefore);
    }

    TransferController controller{4096};
    size_t spoolDirsBefore = 0;
};

TEST_F(TransferControllerTest, SpoolsBytesInOrder) {
    PatternByteSource source(100000);
    auto result = controller.spool(source, Clock::now() + 10s, std::nullopt,
                                   "pattern.bin");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->totalBytes, 100000);
    EXPECT_EQ(result->file.size(), 100000);
    EXPECT_TRUE(result->file.finalized());
    EXPECT_EQ(result->file.path().filename(), "pattern.bin");

    const auto content = readFile(result->file.path());
    ASSERT_EQ(content.size(), 100000);
    for (size_t i = 0; i < content.size(); ++i) {
        ASSERT_EQ(content[i], PatternByteSource::at(i)) << "at offset " << i;
    }
}

TEST_F(TransferControllerTest, EmptySource) {
    MemoryByteSource source("");
    auto result = controller.spool(source, Clock::now() + 10s, 10);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->totalBytes, 0);
}

TEST_F(TransferControllerTest, ExactlyAtLimitIsAccepted) {
    MemoryByteSource source(std::string(5000, 'z'), 1000);
    auto result = controller.spool(source, Clock::now() + 10s, 5000);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->totalBytes, 5000);
}

TEST_F(TransferControllerTest, OverLimitFailsAndLeavesNoSpool) {
    PatternByteSource source(20000);
    auto result = controller.spool(source, Clock::now() + 10s, 10000);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(errorKindOf(result.status()), ErrorKind::kSizeLimitExceeded);
    // Reading stops at the first chunk over the limit.
    EXPECT_LE(source.bytesRead, 10000 + 4096);
    expectNoSpoolLeft();
}

TEST_F(TransferControllerTest, OversizedHintFailsBeforeReading) {
    MemoryByteSource source("tiny", 1024, 1'000'000);
    auto result = controller.spool(source, Clock::now() + 10s, 1000);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(errorKindOf(result.status()), ErrorKind::kSizeLimitExceeded);
    EXPECT_EQ(source.reads, 0);
    expectNoSpoolLeft();
}

TEST_F(TransferControllerTest, ExpiredDeadlineTimesOut) {
    MemoryByteSource source("data");
    auto result = controller.spool(source, Clock::now() - 1s, std::nullopt);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(errorKindOf(result.status()), ErrorKind::kTimeout);
    expectNoSpoolLeft();
}

TEST_F(TransferControllerTest, StalledPipeTimesOut) {
    Pipe pipe;
    ASSERT_TRUE(pipe.pipe());
    const std::string head = "partial upload";
    ASSERT_EQ(::write(pipe.writeEnd(), head.data(), head.size()),
              static_cast<ssize_t>(head.size()));

    FdByteSource source(pipe.readEnd());
    const auto started = Clock::now();
    auto result = controller.spool(source, started + 300ms, std::nullopt);
    const auto elapsed = Clock::now() - started;
    pipe.close();

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(errorKindOf(result.status()), ErrorKind::kTimeout);
    EXPECT_LT(elapsed, 5s);
    expectNoSpoolLeft();
}

TEST_F(TransferControllerTest, SlowButSteadyPipeCompletes) {
    Pipe pipe;
    ASSERT_TRUE(pipe.pipe());
    std::thread writer([&pipe] {
        const std::string piece(512, 'q');
        for (int i = 0; i < 5; ++i) {
            std::this_thread::sleep_for(20ms);
            ASSERT_EQ(::write(pipe.writeEnd(), piece.data(), piece.size()),
                      static_cast<ssize_t>(piece.size()));
        }
        pipe.closeWriteEnd();
    });

    FdByteSource source(pipe.readEnd());
    auto result = controller.spool(source, Clock::now() + 10s, std::nullopt);
    writer.join();
    pipe.closeReadEnd();

    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->totalBytes, 5 * 512);
}

TEST_F(TransferControllerTest, StreamSource) {
    std::istringstream input("streamed content");
    StreamByteSource source(input);
    auto result = controller.spool(source, Clock::now() + 10s, std::nullopt);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(readFile(result->file.path()), "streamed content");
}

TEST(TransferBudgetTest, WouldExceed) {
    tgstore::TransferBudget budget{.deadline = Clock::now() + 1s,
                                   .bytesTransferred = 90,
                                   .limit = 100};
    EXPECT_FALSE(budget.wouldExceed(10));
    EXPECT_TRUE(budget.wouldExceed(11));
    budget.limit.reset();
    EXPECT_FALSE(budget.wouldExceed(1'000'000));
}

TEST(TransferBudgetTest, RemainingClampsAtZero) {
    tgstore::TransferBudget budget{.deadline = Clock::now() - 5s};
    EXPECT_EQ(budget.remaining().count(), 0);
    EXPECT_TRUE(budget.expired());
}

TEST(FdByteSourceTest, TimeoutBeyondIntRangeStillWaits) {
    Pipe pipe;
    ASSERT_TRUE(pipe.pipe());
    std::thread writer([&pipe] {
        std::this_thread::sleep_for(50ms);
        const char byte = 'x';
        ASSERT_EQ(::write(pipe.writeEnd(), &byte, 1), 1);
    });

    FdByteSource source(pipe.readEnd());
    std::array<char, 16> buffer{};
    // 2^32 ms does not fit an int; truncated, it would be a zero wait.
    auto n = source.read(buffer, std::chrono::milliseconds(1LL << 32));
    writer.join();
    pipe.close();

    ASSERT_TRUE(n.ok()) << n.status();
    EXPECT_EQ(*n, 1);
}

TEST(FdByteSourceTest, ReadErrorCarriesErrno) {
    const int fd = ::open("/", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    ASSERT_TRUE(tgstore::isValidFd(fd));
    FdByteSource source(fd, FdByteSource::Ownership::Owned);
    std::array<char, 16> buffer{};
    auto n = source.read(buffer, 1s);
    ASSERT_FALSE(n.ok());
    EXPECT_NE(n.status().message().find(std::strerror(EISDIR)),
              std::string_view::npos)
        << n.status();
}
