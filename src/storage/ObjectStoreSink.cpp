#include "bulkfetch/storage/ObjectStoreSink.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/JsonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unordered_map>

namespace bulkfetch::storage {
namespace {

std::string contentTypeOf(const std::filesystem::path& file) {
    const auto ext = util::toLower(file.extension().string());
    if (ext == ".mp4") return "video/mp4";
    if (ext == ".m4a") return "audio/mp4";
    if (ext == ".webm") return "video/webm";
    if (ext == ".json") return "application/json";
    return "application/octet-stream";
}

void removeQuietly(const std::filesystem::path& file) {
    std::error_code ec;
    std::filesystem::remove(file, ec);
    if (ec) {
        util::log(util::LogLevel::warn, "删除本地文件失败 " + file.string() + ": " + ec.message());
    }
}

} // namespace

ObjectStoreSink::ObjectStoreSink(ObjectStore& objects, std::string prefix)
    : objects_(objects)
    , prefix_(std::move(prefix)) {
    while (!prefix_.empty() && prefix_.back() == '/') {
        prefix_.pop_back();
    }
}

std::string ObjectStoreSink::objectKey(const std::string& channel,
                                       const std::string& itemId,
                                       const std::string& filename) const {
    std::string key = prefix_.empty() ? std::string{} : prefix_ + "/";
    return key + channel + "/" + itemId + "/" + filename;
}

std::string ObjectStoreSink::channelOf(const boost::json::object& metadata) {
    auto channel = util::getString(metadata, "channel_id");
    if (!channel || !model::isSafeItemId(*channel)) {
        return "unknown";
    }
    return *channel;
}

model::StoreResult ObjectStoreSink::store(const std::string& itemId,
                                          const model::Artifact& artifact,
                                          const boost::json::object& metadata) {
    model::StoreResult result;
    if (!model::isSafeItemId(itemId)) {
        result.error = "id is not usable as an object key: " + itemId;
        return result;
    }
    if (artifact.files.empty()) {
        result.error = "nothing to upload for " + itemId;
        return result;
    }

    try {
        const auto channel = channelOf(metadata);
        const auto infoName = itemId + ".info.json";
        const auto infoPath = artifact.files.front().parent_path() / infoName;

        boost::json::array files;
        for (const auto& file : artifact.files) {
            if (file.filename() == infoName) {
                continue;
            }
            const auto name = file.filename().string();
            objects_.putObject(objectKey(channel, itemId, name), file, contentTypeOf(file));
            removeQuietly(file);
            files.emplace_back(name);
        }

        boost::json::object info = metadata;
        info["id"] = itemId;
        info["channel_id"] = channel;
        info["files"] = std::move(files);
        info["bytes"] = static_cast<std::uint64_t>(artifact.bytes);
        info["storedAt"] = util::toEpochMillis(std::chrono::system_clock::now());
        {
            std::ofstream ofs(infoPath, std::ios::trunc);
            if (!ofs.is_open()) {
                throw std::runtime_error("cannot open " + infoPath.string());
            }
            ofs << util::stringifyJson(info);
            if (!ofs.good()) {
                throw std::runtime_error("write failed for " + infoPath.string());
            }
        }
        objects_.putObject(objectKey(channel, itemId, infoName), infoPath, "application/json");
        removeQuietly(infoPath);

        util::log(util::LogLevel::debug,
                  "已上传 id=" + itemId + " 频道=" + channel + " 大小=" +
                      util::formatBytes(static_cast<double>(artifact.bytes)));
        result.success = true;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "上传失败 id=" + itemId + " error=" + ex.what());
        result.success = false;
        result.error = ex.what();
    }
    return result;
}

std::unordered_set<std::string> ObjectStoreSink::storedItems() {
    struct Seen {
        bool info{};
        bool media{};
    };
    std::unordered_map<std::string, Seen> seen;

    const auto listPrefix = prefix_.empty() ? std::string{} : prefix_ + "/";
    for (const auto& key : objects_.listKeys(listPrefix)) {
        // <channel>/<id>/<文件名>
        const auto rest = std::string_view(key).substr(listPrefix.size());
        const auto first = rest.find('/');
        if (first == std::string_view::npos) {
            continue;
        }
        const auto second = rest.find('/', first + 1);
        if (second == std::string_view::npos) {
            continue;
        }
        const auto id = std::string(rest.substr(first + 1, second - first - 1));
        const auto name = rest.substr(second + 1);
        if (id.empty() || name.rfind(id + ".", 0) != 0) {
            continue;
        }
        auto& entry = seen[id];
        if (name == id + ".info.json") {
            entry.info = true;
        } else {
            entry.media = true;
        }
    }

    std::unordered_set<std::string> items;
    for (const auto& [id, entry] : seen) {
        if (entry.info && entry.media) {
            items.insert(id);
        }
    }
    return items;
}

} // namespace bulkfetch::storage
