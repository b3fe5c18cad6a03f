#include <absl/base/log_severity.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/log_sink_registry.h>

#include <optional>
#include <tgstore/LogSinks.hpp>

#include "AbslLogInit.hpp"

static std::optional<tgstore::StderrLogSink> sink;
static std::optional<tgstore::LogFileSink> fileSink;

void TgStore_AbslLogInit() {
    if (sink) {
        return;
    }
    static const bool initialized = [] {
        absl::InitializeLog();
        // StderrLogSink takes over stderr output.
        absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfinity);
        return true;
    }();
    (void)initialized;
    sink.emplace();
    absl::AddLogSink(&*sink);
}

bool TgStore_AbslLogAddFileSink(const std::filesystem::path& path) {
    if (fileSink) {
        absl::RemoveLogSink(&*fileSink);
        fileSink.reset();
    }
    fileSink.emplace(path);
    if (!fileSink->valid()) {
        fileSink.reset();
        return false;
    }
    absl::AddLogSink(&*fileSink);
    return true;
}

void TgStore_AbslLogDeInit() {
    if (fileSink) {
        absl::RemoveLogSink(&*fileSink);
        fileSink.reset();
    }
    if (sink) {
        absl::RemoveLogSink(&*sink);
        sink.reset();
    }
}
