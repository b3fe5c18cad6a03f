#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "internal/FileDescriptor.hpp"

namespace tgstore {

/**
 * @brief A scoped temporary file used to stage an in-flight transfer.
 *
 * Each spool lives in its own private directory under the system temporary
 * directory, and the file inside is named after the payload so transports
 * that derive a document name from the local path keep the caller's
 * filename. The directory and file are removed when the object is destroyed
 * or discard() is called, on every exit path.
 */
class SpoolFile {
   public:
    static constexpr std::string_view kDefaultName = "file";

    /**
     * @brief Creates an empty spool, opened for writing.
     *
     * @param nameHint The file name to use inside the spool directory. It is
     * sanitized; an empty hint becomes kDefaultName.
     */
    static absl::StatusOr<SpoolFile> create(std::string_view nameHint = {});

    /**
     * @brief Creates a finalized spool holding a copy of an existing file.
     *
     * @param source The file to copy.
     * @param nameHint See create().
     */
    static absl::StatusOr<SpoolFile> copyFrom(
        const std::filesystem::path& source, std::string_view nameHint = {});

    // Replaces path separators and NULs, maps empty names to kDefaultName.
    static std::string sanitizeName(std::string_view name);

    SpoolFile(SpoolFile&& other) noexcept;
    SpoolFile& operator=(SpoolFile&& other) noexcept;
    SpoolFile(const SpoolFile&) = delete;
    SpoolFile& operator=(const SpoolFile&) = delete;
    ~SpoolFile();

    // Appends bytes. Only valid before finalize().
    absl::Status write(std::span<const char> data);

    // Flushes and closes the write handle. Further writes fail.
    absl::Status finalize();

    // Removes the spool from disk. Safe to call more than once.
    void discard();

    [[nodiscard]] const std::filesystem::path& path() const { return _path; }
    [[nodiscard]] std::uint64_t size() const { return _size; }
    [[nodiscard]] bool finalized() const { return !isValidFd(_fd); }
    [[nodiscard]] bool valid() const { return !_directory.empty(); }

   private:
    SpoolFile(std::filesystem::path directory, std::filesystem::path path,
              int fd);

    std::filesystem::path _directory;
    std::filesystem::path _path;
    int _fd = kInvalidFD;
    std::uint64_t _size = 0;
};

}  // namespace tgstore
