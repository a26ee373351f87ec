#include "bulkfetch/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace bulkfetch::util {
namespace {
std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

LogLevel& globalLevel() {
    static LogLevel level = LogLevel::info;
    return level;
}

std::ofstream& logFile() {
    static std::ofstream file;
    return file;
}

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(globalLevel());
}
}

void initLogging(LogLevel level) {
    globalLevel() = level;
}

void setLogFile(const std::filesystem::path& path) {
    std::lock_guard lk(logMutex());
    auto& file = logFile();
    if (file.is_open()) {
        file.close();
    }
    if (path.empty()) {
        return;
    }
    file.open(path, std::ios::app);
    if (!file.is_open()) {
        std::clog << "failed to open log file " << path.string() << '\n';
    }
}

LogLevel parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "trace") return LogLevel::trace;
    if (lower == "debug") return LogLevel::debug;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "error") return LogLevel::error;
    return LogLevel::info;
}

void log(LogLevel level, const std::string& message) {
    if (!shouldLog(level)) return;

    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto sec_tp = floor<seconds>(now);
    const auto ms = duration_cast<milliseconds>(now - sec_tp).count();

    std::time_t t = system_clock::to_time_t(sec_tp);
    std::tm tmBuf{};
#ifdef _WIN32
    localtime_s(&tmBuf, &t);
#else
    localtime_r(&t, &tmBuf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms
        << " [" << toString(level) << "] " << message << '\n';

    std::lock_guard lk(logMutex());
    std::clog << oss.str();
    if (auto& file = logFile(); file.is_open()) {
        file << oss.str();
        file.flush();
    }
}

} // namespace bulkfetch::util
