#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bulkfetch::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// 文件不存在或为空时返回 std::nullopt，解析失败抛出异常。
std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path);

std::optional<std::string> getString(const boost::json::object& obj, const char* key);
std::optional<std::int64_t> getInt(const boost::json::object& obj, const char* key);
std::optional<double> getDouble(const boost::json::object& obj, const char* key);
std::optional<bool> getBool(const boost::json::object& obj, const char* key);

} // namespace bulkfetch::util
