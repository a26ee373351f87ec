#include "bulkfetch/repository/ResumableStateStore.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/JsonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <boost/json.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <system_error>

namespace bulkfetch::repository {
namespace {

[[noreturn]] void throwErrno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

void writeAll(int fd, const std::string& data, const std::string& what) {
    const char* cursor = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const auto written = ::write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwErrno(what);
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

void syncDirectory(const std::filesystem::path& directory) {
    const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return;
    }
    ::fsync(fd);
    ::close(fd);
}

StateCounts tally(const std::unordered_map<std::string, model::ResumableRecord>& records) {
    StateCounts counts;
    for (const auto& [id, record] : records) {
        switch (record.status) {
        case model::ItemStatus::pending: ++counts.pending; break;
        case model::ItemStatus::in_progress: ++counts.inProgress; break;
        case model::ItemStatus::complete: ++counts.complete; break;
        case model::ItemStatus::failed: ++counts.failed; break;
        }
    }
    return counts;
}

} // namespace

std::string encodeRecord(const model::ResumableRecord& record) {
    boost::json::object obj;
    obj["id"] = record.itemId;
    obj["status"] = model::toString(record.status);
    obj["ts"] = util::toEpochMillis(record.updatedAt);
    obj["attempts"] = record.attempts;
    if (!record.error.empty()) {
        obj["error"] = record.error;
    }
    return util::stringifyJson(obj);
}

std::optional<model::ResumableRecord> decodeRecord(const std::string& line) {
    boost::system::error_code ec;
    auto value = boost::json::parse(line, ec);
    if (ec || !value.is_object()) {
        return std::nullopt;
    }
    const auto& obj = value.as_object();
    auto id = util::getString(obj, "id");
    auto status = util::getString(obj, "status");
    if (!id || id->empty() || !status) {
        return std::nullopt;
    }
    auto parsed = model::parseItemStatus(*status);
    if (!parsed) {
        return std::nullopt;
    }

    model::ResumableRecord record;
    record.itemId = std::move(*id);
    record.status = *parsed;
    record.updatedAt = util::fromEpochMillis(util::getInt(obj, "ts").value_or(0));
    record.attempts = static_cast<int>(util::getInt(obj, "attempts").value_or(0));
    record.error = util::getString(obj, "error").value_or("");
    return record;
}

ResumableStateStore::ResumableStateStore(std::filesystem::path journalPath)
    : path_(std::move(journalPath)) {}

ResumableStateStore::~ResumableStateStore() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void ResumableStateStore::open() {
    std::scoped_lock lock(mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    records_.clear();

    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }

    std::size_t lines = 0;
    std::size_t skipped = 0;
    std::size_t resumed = 0;
    {
        std::ifstream ifs(path_);
        std::string line;
        while (std::getline(ifs, line)) {
            if (util::trimView(line).empty()) {
                continue;
            }
            ++lines;
            auto record = decodeRecord(line);
            if (!record) {
                ++skipped;
                continue;
            }
            auto it = records_.find(record->itemId);
            if (it != records_.end() && it->second.status == model::ItemStatus::complete &&
                record->status != model::ItemStatus::complete) {
                continue;
            }
            records_[record->itemId] = std::move(*record);
        }
    }
    for (auto& [id, record] : records_) {
        if (record.status == model::ItemStatus::in_progress) {
            record.status = model::ItemStatus::pending;
            ++resumed;
        }
    }
    if (skipped > 0) {
        util::log(util::LogLevel::warn, "状态日志中有 " + std::to_string(skipped) + " 行无法解析，已忽略");
    }

    compactLocked();
    needsCompaction_ = false;

    fd_ = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throwErrno("open " + path_.string());
    }

    const auto summary = tally(records_);
    util::log(util::LogLevel::info,
              "状态库已加载 " + path_.string() + " 记录=" + std::to_string(records_.size()) +
                  " 已完成=" + std::to_string(summary.complete) + " 失败=" + std::to_string(summary.failed) +
                  " 中断恢复=" + std::to_string(resumed) + " 日志行=" + std::to_string(lines));
}

bool ResumableStateStore::isComplete(const std::string& itemId) const {
    std::scoped_lock lock(mutex_);
    auto it = records_.find(itemId);
    return it != records_.end() && it->second.status == model::ItemStatus::complete;
}

std::optional<model::ResumableRecord> ResumableStateStore::record(const std::string& itemId) const {
    std::scoped_lock lock(mutex_);
    auto it = records_.find(itemId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ResumableStateStore::markInProgress(const std::string& itemId) {
    apply(itemId, model::ItemStatus::in_progress, {}, 0);
}

void ResumableStateStore::markComplete(const std::string& itemId, int attempts) {
    apply(itemId, model::ItemStatus::complete, {}, attempts);
}

void ResumableStateStore::markFailed(const std::string& itemId, const std::string& reason, int attempts) {
    apply(itemId, model::ItemStatus::failed, reason, attempts);
}

void ResumableStateStore::markPending(const std::string& itemId) {
    apply(itemId, model::ItemStatus::pending, {}, 0);
}

std::vector<std::string> ResumableStateStore::filterPending(const std::vector<std::string>& itemIds) const {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> pending;
    pending.reserve(itemIds.size());
    for (const auto& id : itemIds) {
        auto it = records_.find(id);
        if (it == records_.end() || it->second.status != model::ItemStatus::complete) {
            pending.push_back(id);
        }
    }
    return pending;
}

StateCounts ResumableStateStore::counts() const {
    std::scoped_lock lock(mutex_);
    return tally(records_);
}

void ResumableStateStore::apply(const std::string& itemId,
                                model::ItemStatus status,
                                const std::string& error,
                                int attempts) {
    std::scoped_lock lock(mutex_);
    ensureOpenLocked();

    auto it = records_.find(itemId);
    if (it != records_.end() && it->second.status == model::ItemStatus::complete &&
        status != model::ItemStatus::complete) {
        util::log(util::LogLevel::warn,
                  "忽略对已完成条目的状态回退 id=" + itemId + " -> " + model::toString(status));
        return;
    }

    model::ResumableRecord updated = it != records_.end() ? it->second : model::ResumableRecord{};
    updated.itemId = itemId;
    updated.status = status;
    updated.updatedAt = std::chrono::system_clock::now();
    updated.attempts += attempts;
    updated.error = error;

    appendLocked(updated);
    records_[itemId] = std::move(updated);
}

void ResumableStateStore::appendLocked(const model::ResumableRecord& record) {
    if (needsCompaction_) {
        reopenLocked();
    }

    const auto offset = ::lseek(fd_, 0, SEEK_END);
    if (offset < 0) {
        throwErrno("seek " + path_.string());
    }
    try {
        writeAll(fd_, encodeRecord(record) + "\n", "append " + path_.string());
        if (::fsync(fd_) != 0) {
            throwErrno("fsync " + path_.string());
        }
    } catch (const std::system_error&) {
        // 去掉写了一半的行，否则下一条记录会接在残行后面。
        if (::ftruncate(fd_, offset) != 0) {
            needsCompaction_ = true;
            util::log(util::LogLevel::warn, "状态日志截断失败，下次写入前重写: " + path_.string());
        }
        throw;
    }
}

void ResumableStateStore::reopenLocked() {
    ::close(fd_);
    fd_ = -1;
    compactLocked();
    fd_ = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throwErrno("open " + path_.string());
    }
    needsCompaction_ = false;
    util::log(util::LogLevel::info, "状态日志已按内存状态重写: " + path_.string());
}

void ResumableStateStore::compactLocked() {
    auto temp = path_;
    temp += ".tmp";

    const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throwErrno("open " + temp.string());
    }
    try {
        std::string payload;
        for (const auto& [id, record] : records_) {
            payload += encodeRecord(record);
            payload += '\n';
        }
        writeAll(fd, payload, "write " + temp.string());
        if (::fsync(fd) != 0) {
            throwErrno("fsync " + temp.string());
        }
    } catch (const std::exception&) {
        ::close(fd);
        throw;
    }
    ::close(fd);

    std::filesystem::rename(temp, path_);
    syncDirectory(path_.has_parent_path() ? path_.parent_path() : std::filesystem::path{"."});
}

void ResumableStateStore::ensureOpenLocked() const {
    if (fd_ < 0) {
        throw std::logic_error("state store used before open(): " + path_.string());
    }
}

} // namespace bulkfetch::repository
