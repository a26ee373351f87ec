#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace bulkfetch::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
void setLogFile(const std::filesystem::path& path);
void log(LogLevel level, const std::string& message);

// 未识别的名称返回 info。
LogLevel parseLogLevel(std::string_view name);

} // namespace bulkfetch::util
