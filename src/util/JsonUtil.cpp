#include "bulkfetch/util/JsonUtil.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace bulkfetch::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (content.empty()) {
        return std::nullopt;
    }
    return parseJson(content);
}

std::optional<std::string> getString(const boost::json::object& obj, const char* key) {
    if (auto it = obj.if_contains(key); it && it->is_string()) {
        return std::string(it->as_string());
    }
    return std::nullopt;
}

std::optional<std::int64_t> getInt(const boost::json::object& obj, const char* key) {
    if (auto it = obj.if_contains(key)) {
        if (it->is_int64()) {
            return it->as_int64();
        }
        if (it->is_uint64()) {
            return static_cast<std::int64_t>(it->as_uint64());
        }
        if (it->is_double()) {
            return static_cast<std::int64_t>(it->as_double());
        }
    }
    return std::nullopt;
}

std::optional<double> getDouble(const boost::json::object& obj, const char* key) {
    if (auto it = obj.if_contains(key)) {
        if (it->is_double()) {
            return it->as_double();
        }
        if (it->is_int64()) {
            return static_cast<double>(it->as_int64());
        }
        if (it->is_uint64()) {
            return static_cast<double>(it->as_uint64());
        }
    }
    return std::nullopt;
}

std::optional<bool> getBool(const boost::json::object& obj, const char* key) {
    if (auto it = obj.if_contains(key)) {
        if (it->is_bool()) {
            return it->as_bool();
        }
        if (it->is_int64()) {
            return it->as_int64() != 0;
        }
    }
    return std::nullopt;
}

} // namespace bulkfetch::util
