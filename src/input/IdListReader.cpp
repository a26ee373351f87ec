#include "bulkfetch/input/IdListReader.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace bulkfetch::input {
namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::vector<std::string_view> splitLines(std::string_view content) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        auto pos = content.find('\n', start);
        auto length = (pos == std::string_view::npos) ? content.size() - start : pos - start;
        auto line = content.substr(start, length);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = (pos == std::string_view::npos) ? content.size() : pos + 1;
    }
    return lines;
}

} // namespace

std::vector<std::string> splitCsvLine(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::vector<std::string> parseItemIds(std::string_view content, const std::string& column) {
    if (content.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        content.remove_prefix(kUtf8Bom.size());
    }

    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    auto add = [&](std::string_view raw) {
        auto id = util::trimView(raw);
        if (id.empty()) {
            return;
        }
        std::string value(id);
        if (seen.insert(value).second) {
            ids.push_back(std::move(value));
        }
    };

    const auto lines = splitLines(content);
    if (column.empty()) {
        for (auto line : lines) {
            auto trimmed = util::trimView(line);
            if (trimmed.empty() || trimmed.front() == '#') {
                continue;
            }
            add(trimmed);
        }
        return ids;
    }

    std::size_t headerIndex = 0;
    while (headerIndex < lines.size() && util::trimView(lines[headerIndex]).empty()) {
        ++headerIndex;
    }
    if (headerIndex == lines.size()) {
        throw std::runtime_error("CSV input is empty, expected a header with column '" + column + "'");
    }

    const auto header = splitCsvLine(lines[headerIndex]);
    std::size_t columnIndex = header.size();
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (util::trimView(header[i]) == util::trimView(column)) {
            columnIndex = i;
            break;
        }
    }
    if (columnIndex == header.size()) {
        throw std::runtime_error("column '" + column + "' not found in CSV header");
    }

    for (std::size_t i = headerIndex + 1; i < lines.size(); ++i) {
        if (util::trimView(lines[i]).empty()) {
            continue;
        }
        const auto fields = splitCsvLine(lines[i]);
        if (columnIndex < fields.size()) {
            add(fields[columnIndex]);
        }
    }
    return ids;
}

std::vector<std::string> readItemIds(const std::filesystem::path& path, const std::string& column) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open ID list " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    auto ids = parseItemIds(content, column);
    util::log(util::LogLevel::info, "读取 ID 列表 " + path.string() + "，共 " + std::to_string(ids.size()) + " 个");
    return ids;
}

} // namespace bulkfetch::input
