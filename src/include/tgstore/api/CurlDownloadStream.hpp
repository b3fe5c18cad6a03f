#pragma once

#include <curl/curl.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <tgstore/ByteStream.hpp>

namespace tgstore {

/**
 * @brief Pulls an HTTP response body on demand.
 *
 * The transfer runs on the curl multi interface and only progresses inside
 * read(). When more than one chunk is buffered the transfer is paused until
 * the reader catches up, so memory stays bounded however large the body is.
 */
class CurlDownloadStream : public ByteStream {
   public:
    // Without progress for this long, the transfer is failed.
    static constexpr std::chrono::seconds kStallTimeout{60};

    static absl::StatusOr<std::unique_ptr<CurlDownloadStream>> open(
        std::string url, std::chrono::seconds connectTimeout);
    ~CurlDownloadStream() override;

    CurlDownloadStream(const CurlDownloadStream&) = delete;
    CurlDownloadStream& operator=(const CurlDownloadStream&) = delete;

    absl::StatusOr<size_t> read(std::span<char> buffer) override;
    void abort() override;

    // The URL without credentials, for logging.
    static std::string redact(std::string_view url);

    // Runs curl_global_init once per process. Called by open(); call it
    // early when other libcurl users are created first.
    static absl::Status initGlobal();

   private:
    CurlDownloadStream(CURLM* multi, CURL* easy, std::string url);

    static size_t onWrite(char* data, size_t size, size_t nmemb, void* self);
    // Drives the transfer until data is buffered or it finishes.
    absl::Status pump();
    absl::Status finishedStatus(CURLcode code);
    void cleanup();

    CURLM* _multi;
    CURL* _easy;
    std::string _url;
    std::string _buffer;
    size_t _offset = 0;
    std::uint64_t _received = 0;
    bool _paused = false;
    bool _finished = false;
    bool _aborted = false;
};

}  // namespace tgstore
