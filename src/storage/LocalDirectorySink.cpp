#include "bulkfetch/storage/StorageSink.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/JsonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <fstream>
#include <system_error>

namespace bulkfetch::storage {
namespace {

// rename 跨设备失败时退回到复制后删除。
void moveFile(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throw std::filesystem::filesystem_error("move failed", from, to, ec);
    }
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);
    std::filesystem::remove(from);
}

} // namespace

LocalDirectorySink::LocalDirectorySink(std::filesystem::path outputRoot)
    : outputRoot_(std::move(outputRoot)) {}

model::StoreResult LocalDirectorySink::store(const std::string& itemId,
                                             const model::Artifact& artifact,
                                             const boost::json::object& metadata) {
    model::StoreResult result;
    if (!model::isSafeItemId(itemId)) {
        result.error = "id is not usable as a file name: " + itemId;
        return result;
    }
    try {
        const auto directory = outputRoot_ / itemId;
        std::filesystem::create_directories(directory);

        boost::json::array files;
        for (const auto& file : artifact.files) {
            const auto target = directory / file.filename();
            moveFile(file, target);
            files.emplace_back(target.filename().string());
        }

        boost::json::object info = metadata;
        info["id"] = itemId;
        info["files"] = std::move(files);
        info["bytes"] = static_cast<std::uint64_t>(artifact.bytes);
        info["elapsedMs"] = static_cast<std::int64_t>(artifact.elapsed.count());
        info["storedAt"] = util::toEpochMillis(std::chrono::system_clock::now());

        const auto infoPath = directory / (itemId + ".info.json");
        std::ofstream ofs(infoPath, std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("cannot open " + infoPath.string());
        }
        ofs << util::stringifyJson(info);
        if (!ofs.good()) {
            throw std::runtime_error("write failed for " + infoPath.string());
        }

        util::log(util::LogLevel::debug,
                  "已保存 id=" + itemId + " 文件数=" + std::to_string(artifact.files.size()) + " 大小=" +
                      util::formatBytes(static_cast<double>(artifact.bytes)));
        result.success = true;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "保存失败 id=" + itemId + " error=" + ex.what());
        result.success = false;
        result.error = ex.what();
    }
    return result;
}

std::unordered_set<std::string> LocalDirectorySink::storedItems() {
    std::unordered_set<std::string> items;
    if (!std::filesystem::is_directory(outputRoot_)) {
        return items;
    }
    for (const auto& entry : std::filesystem::directory_iterator(outputRoot_)) {
        if (!entry.is_directory()) {
            continue;
        }
        const auto id = entry.path().filename().string();
        if (std::filesystem::exists(entry.path() / (id + ".info.json"))) {
            items.insert(id);
        }
    }
    return items;
}

} // namespace bulkfetch::storage
