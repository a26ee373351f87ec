#pragma once

#include "bulkfetch/model/ResumableRecord.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bulkfetch::repository {

struct StateCounts {
    std::size_t pending{};
    std::size_t inProgress{};
    std::size_t complete{};
    std::size_t failed{};
};

// 追加写入的 JSON Lines 日志，每次变更都在返回前 fsync。
class ResumableStateStore {
public:
    explicit ResumableStateStore(std::filesystem::path journalPath);
    virtual ~ResumableStateStore();

    ResumableStateStore(const ResumableStateStore&) = delete;
    ResumableStateStore& operator=(const ResumableStateStore&) = delete;

    // 重放并压缩日志，IN_PROGRESS 视为 PENDING。I/O 失败抛出 std::system_error。
    void open();

    bool isComplete(const std::string& itemId) const;
    std::optional<model::ResumableRecord> record(const std::string& itemId) const;

    // 写入失败抛出 std::system_error，内存状态保持不变。
    virtual void markInProgress(const std::string& itemId);
    virtual void markComplete(const std::string& itemId, int attempts = 0);
    virtual void markFailed(const std::string& itemId, const std::string& reason, int attempts = 0);
    virtual void markPending(const std::string& itemId);

    std::vector<std::string> filterPending(const std::vector<std::string>& itemIds) const;
    StateCounts counts() const;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    void apply(const std::string& itemId, model::ItemStatus status, const std::string& error, int attempts);
    void appendLocked(const model::ResumableRecord& record);
    void compactLocked();
    void reopenLocked();
    void ensureOpenLocked() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, model::ResumableRecord> records_;
    int fd_{-1};
    // 追加失败且无法截断时置位，下次写入前先按内存状态重写日志。
    bool needsCompaction_{false};
};

std::string encodeRecord(const model::ResumableRecord& record);
std::optional<model::ResumableRecord> decodeRecord(const std::string& line);

} // namespace bulkfetch::repository
