#pragma once

#include "bulkfetch/storage/StorageSink.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bulkfetch::storage {

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // 失败时抛出异常。
    virtual void putObject(const std::string& key,
                           const std::filesystem::path& file,
                           const std::string& contentType) = 0;
    virtual std::vector<std::string> listKeys(const std::string& prefix) = 0;
};

// 对象键为 <prefix>/<channel_id>/<id>/<文件名>，<id>.info.json 最后上传，作为条目完整的标记。
// 上传成功的本地文件随即删除。
class ObjectStoreSink : public StorageSink {
public:
    explicit ObjectStoreSink(ObjectStore& objects, std::string prefix = "downloads");

    model::StoreResult store(const std::string& itemId,
                             const model::Artifact& artifact,
                             const boost::json::object& metadata) override;

    // 同时具备 <id>.info.json 与至少一个媒体文件的条目。
    std::unordered_set<std::string> storedItems() override;

    std::string objectKey(const std::string& channel, const std::string& itemId, const std::string& filename) const;

    // metadata 中的 channel_id，缺失或不能作为路径段时为 "unknown"。
    static std::string channelOf(const boost::json::object& metadata);

private:
    ObjectStore& objects_;
    std::string prefix_;
};

} // namespace bulkfetch::storage
