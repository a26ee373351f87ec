#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bulkfetch::input {

// column 非空时按带表头的 CSV 读取该列，否则每行一个 ID（# 开头为注释）。
// 结果去除首尾空白并按首次出现去重；文件无法打开或列不存在时抛出 std::runtime_error。
std::vector<std::string> readItemIds(const std::filesystem::path& path, const std::string& column = {});

std::vector<std::string> parseItemIds(std::string_view content, const std::string& column = {});

std::vector<std::string> splitCsvLine(std::string_view line);

} // namespace bulkfetch::input
