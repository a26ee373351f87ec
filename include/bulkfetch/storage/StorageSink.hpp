#pragma once

#include "bulkfetch/model/DownloadTask.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <string>
#include <unordered_set>

namespace bulkfetch::storage {

class StorageSink {
public:
    virtual ~StorageSink() = default;

    // 失败一律视为可重试。
    virtual model::StoreResult store(const std::string& itemId,
                                     const model::Artifact& artifact,
                                     const boost::json::object& metadata) = 0;

    // 已完整保存的条目 ID，运行前用于跳过。查询失败时抛出异常。
    virtual std::unordered_set<std::string> storedItems() { return {}; }
};

// <outputRoot>/<id>/ 下保存文件和 <id>.info.json。
class LocalDirectorySink : public StorageSink {
public:
    explicit LocalDirectorySink(std::filesystem::path outputRoot);

    model::StoreResult store(const std::string& itemId,
                             const model::Artifact& artifact,
                             const boost::json::object& metadata) override;

    std::unordered_set<std::string> storedItems() override;

    const std::filesystem::path& outputRoot() const noexcept { return outputRoot_; }

private:
    std::filesystem::path outputRoot_;
};

} // namespace bulkfetch::storage
