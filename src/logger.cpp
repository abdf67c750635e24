#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace {
struct SFileSink {
    std::mutex mutex;
    std::string path;
    uint64_t max_bytes = 0;
    uint64_t max_files = 0;
};

SFileSink& FileSink() {
    static SFileSink sink;
    return sink;
}

const char* LevelName(LogLevel level) {
    return level == LogLevel::INFO ? "INFO" : "ERROR";
}

uint64_t NowMs() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

void AppendToFile(LogLevel level, std::string_view component, std::string_view message) {
    auto& sink = FileSink();
    std::lock_guard<std::mutex> lock(sink.mutex);
    if (sink.path.empty()) {
        return;
    }
    RotateLogsIfNeeded(sink.path, sink.max_bytes, sink.max_files);
    std::ofstream out(sink.path, std::ios::app);
    if (!out) {
        return;
    }
    out << "[" << FormatIsoUtc(NowMs()) << "] [" << LevelName(level) << "] ["
        << component << "] " << message << "\n";
}
}

std::string FormatIsoUtc(uint64_t timestamp_ms) {
    using namespace std::chrono;
    const auto tp = system_clock::time_point{milliseconds(timestamp_ms)};
    std::time_t tt = system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

void Log(LogLevel level, std::string_view component, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    std::time_t time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::ostream& os = (level == LogLevel::ERROR) ? std::cerr : std::cout;
    os << std::put_time(&tm, "[%Y-%m-%d %H:%M:%S]") << " [" << LevelName(level) << "] [" << component << "] " << message << std::endl;
    AppendToFile(level, component, message);
}

void InitLogFile(const std::string& path, uint64_t max_bytes, uint64_t max_files) {
    auto& sink = FileSink();
    std::lock_guard<std::mutex> lock(sink.mutex);
    sink.path = path;
    sink.max_bytes = max_bytes;
    sink.max_files = max_files;
}

void CloseLogFile() {
    InitLogFile({}, 0, 0);
}

std::string DefaultLogPath() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return "goldticker.log";
    }
    return (dir / "goldticker.log").string();
}

void RotateLogsIfNeeded(const std::string& path, uint64_t max_bytes, uint64_t max_files) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (max_bytes == 0 || max_files == 0 || !fs::exists(path, ec)) {
        return;
    }
    const auto size = fs::file_size(path, ec);
    if (ec || size < max_bytes) {
        return;
    }

    const fs::path base(path);
    const fs::path dir = base.parent_path();
    const std::string filename = base.filename().string();

    // Remove the oldest
    fs::path oldest = dir / (filename + "." + std::to_string(max_files));
    if (fs::exists(oldest, ec)) {
        fs::remove(oldest, ec);
    }

    // Shift existing files
    for (uint64_t i = max_files; i > 1; --i) {
        fs::path from = dir / (filename + "." + std::to_string(i - 1));
        fs::path to = dir / (filename + "." + std::to_string(i));
        if (fs::exists(from, ec)) {
            fs::rename(from, to, ec);
        }
    }

    // Rotate current
    fs::path rotated = dir / (filename + ".1");
    fs::rename(base, rotated, ec);
}
