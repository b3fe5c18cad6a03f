#include <absl/log/log.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <tgstore/Errors.hpp>
#include <tgstore/Types.hpp>
#include <tgstore/api/CurlDownloadStream.hpp>
#include <utility>

namespace tgstore {

namespace {
constexpr long kMaxRedirects = 5;
constexpr int kPollTimeoutMs = 1000;
constexpr long kHttpNotFound = 404;
}  // namespace

std::string CurlDownloadStream::redact(std::string_view url) {
    const auto begin = url.find("/bot");
    if (begin == std::string_view::npos) {
        return std::string(url);
    }
    const auto end = url.find('/', begin + 4);
    if (end == std::string_view::npos) {
        return fmt::format("{}/bot<redacted>", url.substr(0, begin));
    }
    return fmt::format("{}/bot<redacted>{}", url.substr(0, begin),
                       url.substr(end));
}

absl::Status CurlDownloadStream::initGlobal() {
    static const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        LOG(ERROR) << "curl_global_init failed: " << curl_easy_strerror(code);
        return TransportError(fmt::format("Cannot initialize libcurl: {}",
                                          curl_easy_strerror(code)));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<CurlDownloadStream>> CurlDownloadStream::open(
    std::string url, const std::chrono::seconds connectTimeout) {
    if (auto status = initGlobal(); !status.ok()) {
        return status;
    }
    CURL* easy = curl_easy_init();
    if (easy == nullptr) {
        LOG(ERROR) << "Cannot initialize curl";
        return TransportError("Cannot initialize curl");
    }
    CURLM* multi = curl_multi_init();
    if (multi == nullptr) {
        curl_easy_cleanup(easy);
        LOG(ERROR) << "Cannot initialize curl multi handle";
        return TransportError("Cannot initialize curl multi handle");
    }
    std::unique_ptr<CurlDownloadStream> stream(
        new CurlDownloadStream(multi, easy, std::move(url)));

    curl_easy_setopt(easy, CURLOPT_URL, stream->_url.c_str());
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, kMaxRedirects);
    // Turn HTTP errors into CURLE_HTTP_RETURNED_ERROR instead of a body.
    curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(connectTimeout.count()));
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlDownloadStream::onWrite);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, stream.get());

    if (const CURLMcode mc = curl_multi_add_handle(multi, easy);
        mc != CURLM_OK) {
        return TransportError(fmt::format("Cannot start download: {}",
                                          curl_multi_strerror(mc)));
    }
    LOG(INFO) << "Opened download stream for " << redact(stream->_url);
    return stream;
}

CurlDownloadStream::CurlDownloadStream(CURLM* multi, CURL* easy,
                                       std::string url)
    : _multi(multi), _easy(easy), _url(std::move(url)) {}

CurlDownloadStream::~CurlDownloadStream() { cleanup(); }

void CurlDownloadStream::cleanup() {
    if (_multi != nullptr && _easy != nullptr) {
        curl_multi_remove_handle(_multi, _easy);
    }
    if (_easy != nullptr) {
        curl_easy_cleanup(_easy);
        _easy = nullptr;
    }
    if (_multi != nullptr) {
        curl_multi_cleanup(_multi);
        _multi = nullptr;
    }
    _buffer.clear();
    _offset = 0;
}

size_t CurlDownloadStream::onWrite(char* data, size_t size, size_t nmemb,
                                   void* self) {
    auto* stream = static_cast<CurlDownloadStream*>(self);
    const size_t bytes = size * nmemb;
    if (stream->_buffer.size() - stream->_offset >= kChunkSize) {
        // curl keeps this block and hands it to us again after unpausing.
        stream->_paused = true;
        return CURL_WRITEFUNC_PAUSE;
    }
    stream->_buffer.append(data, bytes);
    stream->_received += bytes;
    LOG_EVERY_N_SEC(INFO, 5) << fmt::format(
        "Download: {:.2f}MB", static_cast<double>(stream->_received) /
                                  (1024.0 * 1024.0));
    return bytes;
}

absl::Status CurlDownloadStream::finishedStatus(const CURLcode code) {
    if (code == CURLE_OK) {
        LOG(INFO) << fmt::format("Download of {} finished, {} bytes",
                                 redact(_url), _received);
        return absl::OkStatus();
    }
    if (code == CURLE_HTTP_RETURNED_ERROR) {
        long httpCode = 0;
        curl_easy_getinfo(_easy, CURLINFO_RESPONSE_CODE, &httpCode);
        LOG(ERROR) << fmt::format("Download of {} failed with HTTP {}",
                                  redact(_url), httpCode);
        if (httpCode == kHttpNotFound) {
            return NotFoundError("File is no longer available on the CDN");
        }
        return TransportError(
            fmt::format("File CDN responded with HTTP {}", httpCode));
    }
    if (code == CURLE_REMOTE_FILE_NOT_FOUND ||
        code == CURLE_FILE_COULDNT_READ_FILE) {
        LOG(ERROR) << fmt::format("Download of {} failed: {}", redact(_url),
                                  curl_easy_strerror(code));
        return NotFoundError(
            fmt::format("File not found: {}", curl_easy_strerror(code)));
    }
    LOG(ERROR) << fmt::format("Download of {} failed: {}", redact(_url),
                              curl_easy_strerror(code));
    return TransportError(
        fmt::format("Download failed: {}", curl_easy_strerror(code)));
}

absl::Status CurlDownloadStream::pump() {
    auto lastProgress = Clock::now();
    std::uint64_t lastReceived = _received;
    while (_offset == _buffer.size() && !_finished) {
        int running = 0;
        if (const CURLMcode mc = curl_multi_perform(_multi, &running);
            mc != CURLM_OK) {
            return TransportError(
                fmt::format("Download failed: {}", curl_multi_strerror(mc)));
        }
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(_multi, &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                _finished = true;
                if (auto status = finishedStatus(msg->data.result);
                    !status.ok()) {
                    return status;
                }
            }
        }
        if (_offset < _buffer.size() || _finished) {
            break;
        }
        if (_received != lastReceived) {
            lastReceived = _received;
            lastProgress = Clock::now();
        } else if (Clock::now() - lastProgress > kStallTimeout) {
            return TimeoutError(fmt::format(
                "Download stalled for {}s after {} bytes",
                kStallTimeout.count(), _received));
        }
        if (const CURLMcode mc =
                curl_multi_poll(_multi, nullptr, 0, kPollTimeoutMs, nullptr);
            mc != CURLM_OK) {
            return TransportError(
                fmt::format("Download failed: {}", curl_multi_strerror(mc)));
        }
    }
    return absl::OkStatus();
}

absl::StatusOr<size_t> CurlDownloadStream::read(std::span<char> buffer) {
    if (_aborted || buffer.empty()) {
        return 0;
    }
    while (_offset == _buffer.size()) {
        _buffer.clear();
        _offset = 0;
        if (_paused) {
            _paused = false;
            // May deliver the held block through onWrite right away.
            curl_easy_pause(_easy, CURLPAUSE_CONT);
            continue;
        }
        if (_finished) {
            cleanup();
            return 0;
        }
        if (auto status = pump(); !status.ok()) {
            _aborted = true;
            cleanup();
            return status;
        }
    }
    const size_t count =
        std::min({buffer.size(), kChunkSize, _buffer.size() - _offset});
    std::memcpy(buffer.data(), _buffer.data() + _offset, count);
    _offset += count;
    return count;
}

void CurlDownloadStream::abort() {
    if (!_aborted) {
        DLOG(INFO) << "Aborting download of " << redact(_url);
    }
    _aborted = true;
    cleanup();
}

}  // namespace tgstore
