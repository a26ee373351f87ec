#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace bulkfetch::util {

std::string_view trimView(std::string_view input);
std::string toLower(std::string_view input);
std::string replaceAll(std::string text, std::string_view from, std::string_view to);

// 单引号包裹，供 /bin/sh 使用。
std::string shellQuote(std::string_view value);

std::string formatBytes(double bytes);

template <std::size_t N>
bool containsKeyword(std::string_view message, const std::array<std::string_view, N>& keywords) {
    for (auto keyword : keywords) {
        if (message.find(keyword) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

std::int64_t toEpochMillis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point fromEpochMillis(std::int64_t millis);

} // namespace bulkfetch::util
