#pragma once

#include <filesystem>

/**
 * Initializes the Abseil Logging library for TgStore.
 * Registers a stderr sink for warnings and errors.
 *
 * @note This function is expected to be called only once during the
 * initialization of the application, before anything logs.
 */
extern void TgStore_AbslLogInit();

/**
 * Adds a sink that appends every log entry to a file.
 *
 * @param path The log file, created if missing.
 * @return false if the file could not be opened.
 */
extern bool TgStore_AbslLogAddFileSink(const std::filesystem::path& path);

// Unregisters the sinks added above.
extern void TgStore_AbslLogDeInit();
