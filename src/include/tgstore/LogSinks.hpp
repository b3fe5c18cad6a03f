#pragma once

#include <absl/log/log_entry.h>
#include <absl/log/log_sink.h>
#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <mutex>

namespace tgstore {

// Writes warnings and errors to stderr.
struct StderrLogSink : absl::LogSink {
    void Send(const absl::LogEntry& entry) override;

   private:
    std::mutex _mutex;
};

// Appends every entry to a file, through an spdlog file logger.
struct LogFileSink : absl::LogSink {
    explicit LogFileSink(const std::filesystem::path& filename);
    ~LogFileSink() override;

    void Send(const absl::LogEntry& entry) override;
    void Flush() override;

    [[nodiscard]] bool valid() const { return _logger != nullptr; }

   private:
    std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace tgstore
