#include <absl/log/log.h>
#include <absl/strings/str_cat.h>
#include <fcntl.h>
#include <fmt/format.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <tgstore/SpoolFile.hpp>
#include <utility>
#include <vector>

namespace tgstore {

namespace {

absl::Status errnoStatus(const std::string_view what, const int err) {
    return absl::InternalError(
        fmt::format("{}: {}", what, std::strerror(err)));
}

}  // namespace

std::string SpoolFile::sanitizeName(const std::string_view name) {
    std::string result;
    result.reserve(name.size());
    for (const char c : name) {
        if (c == '/' || c == '\\' || c == '\0') {
            result += '_';
        } else {
            result += c;
        }
    }
    if (result.empty() || result == "." || result == "..") {
        return std::string(kDefaultName);
    }
    return result;
}

absl::StatusOr<SpoolFile> SpoolFile::create(const std::string_view nameHint) {
    std::error_code ec;
    const auto tempRoot = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return absl::InternalError(
            absl::StrCat("No temporary directory: ", ec.message()));
    }

    std::string templ = (tempRoot / "tgstore-XXXXXX").string();
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.emplace_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        return errnoStatus("mkdtemp", errno);
    }
    std::filesystem::path directory(buffer.data());
    std::filesystem::path path = directory / sanitizeName(nameHint);

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                    S_IRUSR | S_IWUSR);
    if (!isValidFd(fd)) {
        const int err = errno;
        std::filesystem::remove_all(directory, ec);
        return errnoStatus(fmt::format("open {}", path.string()), err);
    }
    DLOG(INFO) << "Created spool " << path;
    return SpoolFile(std::move(directory), std::move(path), fd);
}

absl::StatusOr<SpoolFile> SpoolFile::copyFrom(
    const std::filesystem::path& source, const std::string_view nameHint) {
    auto spool = create(nameHint);
    if (!spool.ok()) {
        return spool.status();
    }
    if (auto status = spool->finalize(); !status.ok()) {
        return status;
    }
    std::error_code ec;
    std::filesystem::copy_file(
        source, spool->path(),
        std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return absl::InternalError(fmt::format("Cannot copy {} to spool: {}",
                                               source.string(), ec.message()));
    }
    spool->_size = std::filesystem::file_size(spool->path(), ec);
    if (ec) {
        return absl::InternalError(
            absl::StrCat("Cannot stat spool: ", ec.message()));
    }
    return spool;
}

SpoolFile::SpoolFile(std::filesystem::path directory,
                     std::filesystem::path path, int fd)
    : _directory(std::move(directory)), _path(std::move(path)), _fd(fd) {}

SpoolFile::SpoolFile(SpoolFile&& other) noexcept
    : _directory(std::exchange(other._directory, {})),
      _path(std::exchange(other._path, {})),
      _fd(std::exchange(other._fd, kInvalidFD)),
      _size(std::exchange(other._size, 0)) {}

SpoolFile& SpoolFile::operator=(SpoolFile&& other) noexcept {
    if (this != &other) {
        discard();
        _directory = std::exchange(other._directory, {});
        _path = std::exchange(other._path, {});
        _fd = std::exchange(other._fd, kInvalidFD);
        _size = std::exchange(other._size, 0);
    }
    return *this;
}

SpoolFile::~SpoolFile() { discard(); }

absl::Status SpoolFile::write(std::span<const char> data) {
    if (!isValidFd(_fd)) {
        return absl::FailedPreconditionError("Spool is not writable");
    }
    while (!data.empty()) {
        const ssize_t written = ::write(_fd, data.data(), data.size());
        if (written < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            return errnoStatus(fmt::format("write {}", _path.string()), err);
        }
        _size += static_cast<std::uint64_t>(written);
        data = data.subspan(static_cast<size_t>(written));
    }
    return absl::OkStatus();
}

absl::Status SpoolFile::finalize() {
    if (!isValidFd(_fd)) {
        return absl::OkStatus();
    }
    int rc = ::close(_fd);
    const int err = errno;
    _fd = kInvalidFD;
    if (rc != 0) {
        return errnoStatus(fmt::format("close {}", _path.string()), err);
    }
    return absl::OkStatus();
}

void SpoolFile::discard() {
    closeFd(_fd);
    if (_directory.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(_directory, ec);
    if (ec) {
        LOG(ERROR) << "Failed to remove spool " << _directory << ": "
                   << ec.message();
    } else {
        DLOG(INFO) << "Removed spool " << _path;
    }
    _directory.clear();
    _path.clear();
    _size = 0;
}

}  // namespace tgstore
