#pragma once

#include <cstdint>
#include <string>
#include <string_view>

enum class LogLevel { INFO, ERROR };
void Log(LogLevel level, std::string_view component, std::string_view message);

// Mirrors every Log() line into `path`, rotating once it reaches max_bytes.
// An empty path disables the file sink.
void InitLogFile(const std::string& path, uint64_t max_bytes, uint64_t max_files);
void CloseLogFile();

std::string DefaultLogPath();
std::string FormatIsoUtc(uint64_t timestamp_ms);
void RotateLogsIfNeeded(const std::string& path, uint64_t max_bytes, uint64_t max_files);
