#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>
#include <tgstore/ByteSource.hpp>
#include <tgstore/ByteStream.hpp>
#include <tgstore/SpoolFile.hpp>

// Serves a fixed payload, at most maxChunk bytes per read.
class MemoryByteSource : public tgstore::ByteSource {
   public:
    explicit MemoryByteSource(
        std::string data,
        size_t maxChunk = std::numeric_limits<size_t>::max(),
        std::optional<std::uint64_t> hint = std::nullopt)
        : _data(std::move(data)), _maxChunk(maxChunk), _hint(hint) {}

    absl::StatusOr<size_t> read(std::span<char> buffer,
                                std::chrono::milliseconds /*timeout*/) override {
        ++reads;
        const size_t n =
            std::min({buffer.size(), _maxChunk, _data.size() - _offset});
        std::memcpy(buffer.data(), _data.data() + _offset, n);
        _offset += n;
        return n;
    }

    [[nodiscard]] std::optional<std::uint64_t> sizeHint() const override {
        return _hint;
    }

    int reads = 0;

   private:
    std::string _data;
    size_t _offset = 0;
    size_t _maxChunk;
    std::optional<std::uint64_t> _hint;
};

// Produces `total` bytes of a repeating pattern without holding them.
class PatternByteSource : public tgstore::ByteSource {
   public:
    explicit PatternByteSource(std::uint64_t total) : _total(total) {}

    static char at(std::uint64_t offset) {
        return static_cast<char>('a' + offset % 26);
    }

    absl::StatusOr<size_t> read(std::span<char> buffer,
                                std::chrono::milliseconds /*timeout*/) override {
        const auto n = static_cast<size_t>(
            std::min<std::uint64_t>(buffer.size(), _total - bytesRead));
        for (size_t i = 0; i < n; ++i) {
            buffer[i] = at(bytesRead + i);
        }
        bytesRead += n;
        return n;
    }

    std::uint64_t bytesRead = 0;

   private:
    std::uint64_t _total;
};

// A download stream over an in-memory payload.
class MemoryByteStream : public tgstore::ByteStream {
   public:
    explicit MemoryByteStream(std::string data, bool* aborted = nullptr)
        : _data(std::move(data)), _aborted(aborted) {}

    absl::StatusOr<size_t> read(std::span<char> buffer) override {
        const size_t n = std::min(buffer.size(), _data.size() - _offset);
        std::memcpy(buffer.data(), _data.data() + _offset, n);
        _offset += n;
        return n;
    }

    void abort() override {
        _offset = _data.size();
        if (_aborted != nullptr) {
            *_aborted = true;
        }
    }

   private:
    std::string _data;
    size_t _offset = 0;
    bool* _aborted;
};

inline std::string drainStream(tgstore::ByteStream& stream) {
    std::string result;
    std::array<char, 4096> buffer{};
    while (true) {
        auto n = stream.read(buffer);
        EXPECT_TRUE(n.ok()) << n.status();
        if (!n.ok() || *n == 0) {
            break;
        }
        result.append(buffer.data(), *n);
    }
    return result;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(ifs),
            std::istreambuf_iterator<char>()};
}

// A finalized spool holding `content`.
inline tgstore::SpoolFile makeSpool(const std::string& content,
                                    std::string_view name = "payload.bin") {
    auto spool = tgstore::SpoolFile::create(name);
    EXPECT_TRUE(spool.ok()) << spool.status();
    EXPECT_TRUE(spool->write({content.data(), content.size()}).ok());
    EXPECT_TRUE(spool->finalize().ok());
    return std::move(*spool);
}
