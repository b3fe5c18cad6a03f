#include <absl/log/log.h>
#include <absl/log/log_entry.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <tgstore/LogSinks.hpp>

namespace tgstore {

namespace {

spdlog::level::level_enum toSpdlogLevel(const absl::LogSeverity severity) {
    switch (severity) {
        case absl::LogSeverity::kInfo:
            return spdlog::level::info;
        case absl::LogSeverity::kWarning:
            return spdlog::level::warn;
        case absl::LogSeverity::kError:
            return spdlog::level::err;
        case absl::LogSeverity::kFatal:
            return spdlog::level::critical;
    }
    return spdlog::level::info;
}

}  // namespace

void StderrLogSink::Send(const absl::LogEntry& entry) {
    if (entry.log_severity() < absl::LogSeverity::kWarning) {
        return;
    }
    const std::lock_guard<std::mutex> lock(_mutex);
    std::cerr << entry.text_message_with_prefix_and_newline();
}

LogFileSink::LogFileSink(const std::filesystem::path& filename) {
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            filename.string());
        _logger = std::make_shared<spdlog::logger>("tgstore", std::move(sink));
        _logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%L] %v");
        _logger->set_level(spdlog::level::trace);
        _logger->flush_on(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex& ex) {
        // This sink is not registered yet, so the message goes to stderr.
        LOG(ERROR) << "Couldn't open log file " << filename << ": "
                   << ex.what();
        _logger.reset();
    }
}

LogFileSink::~LogFileSink() {
    if (_logger) {
        _logger->flush();
    }
}

void LogFileSink::Send(const absl::LogEntry& entry) {
    if (!_logger) {
        return;
    }
    _logger->log(toSpdlogLevel(entry.log_severity()), "{}:{}] {}",
                 entry.source_basename(), entry.source_line(),
                 entry.text_message());
}

void LogFileSink::Flush() {
    if (_logger) {
        _logger->flush();
    }
}

}  // namespace tgstore
