#pragma once

#include "bulkfetch/download/Downloader.hpp"
#include "bulkfetch/model/DownloadTask.hpp"
#include "bulkfetch/repository/ResumableStateStore.hpp"
#include "bulkfetch/service/ProxySupervisor.hpp"
#include "bulkfetch/storage/StorageSink.hpp"
#include "bulkfetch/util/Cancellation.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace bulkfetch::workflow {

enum class TaskState {
    pending,
    acquiring_proxy,
    downloading,
    retrying,
    succeeded,
    failed
};

const char* toString(TaskState state);

struct OrchestratorConfig {
    unsigned int maxConcurrent{5};
    int maxRetries{3};
    int errorThreshold{10};
    // 下载暂存目录，每个条目使用 <workDirectory>/<id>/。
    std::filesystem::path workDirectory;
    model::DownloadConstraints constraints;
    std::chrono::seconds downloadTimeout{};
    // 为空时不校验 ID。
    std::string idPattern;
    std::chrono::milliseconds acquireBackoffInitial{std::chrono::seconds{1}};
    std::chrono::milliseconds acquireBackoffCap{std::chrono::seconds{30}};
    std::chrono::seconds proxyWaitLimit{std::chrono::minutes{5}};
    std::chrono::milliseconds retryBackoff{std::chrono::seconds{2}};
    std::chrono::milliseconds retryBackoffCap{std::chrono::minutes{1}};
    std::size_t progressInterval{10};
};

struct RunSummary {
    std::size_t total{};
    std::size_t skipped{};
    std::size_t completed{};
    std::size_t failed{};
    // 未完成的条目，含 deferred。
    std::size_t pending{};
    // 等待代理超时而留作 PENDING 的条目。
    std::size_t deferred{};
    bool breakerTripped{};
    bool cancelled{};
    // 状态日志写入失败，运行已中止。
    bool journalFailed{};
};

using TransitionListener = std::function<void(const std::string& itemId, TaskState state, int attempt)>;

// 每个实例只执行一次 run()。
class DownloadOrchestrator {
public:
    DownloadOrchestrator(OrchestratorConfig config,
                         service::ProxySupervisor& supervisor,
                         download::Downloader& downloader,
                         storage::StorageSink& sink,
                         repository::ResumableStateStore& store);

    DownloadOrchestrator(const DownloadOrchestrator&) = delete;
    DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

    RunSummary run(const std::vector<std::string>& itemIds);

    // 线程安全，可在信号处理线程中调用。
    void cancel();

    void setTransitionListener(TransitionListener listener);

    bool breakerTripped() const noexcept { return breakerTripped_; }
    bool journalFailed() const noexcept { return journalFailed_; }
    const OrchestratorConfig& config() const noexcept { return config_; }

private:
    enum class TaskOutcome {
        succeeded,
        failed,
        deferred,
        abandoned
    };

    void workerLoop();
    std::optional<std::string> nextItem();
    TaskOutcome processTask(const std::string& itemId);
    std::vector<std::string> skipStored(std::vector<std::string> pending, std::size_t& skipped);
    std::optional<proxy::ProxyEndpoint> acquireProxy(const std::string& itemId,
                                                     const std::unordered_set<std::string>& excluded);
    TaskOutcome failTask(const std::string& itemId, const model::Failure& failure, int attempts);
    TaskOutcome returnToPending(const std::string& itemId, TaskOutcome outcome);
    // 写入失败时记录错误并中止整个运行。
    bool recordState(const char* action, const std::string& itemId, const std::function<void()>& write);
    void finishTask(const std::string& itemId, TaskOutcome outcome);
    void notify(const std::string& itemId, TaskState state, int attempt) const;
    bool stopping() const;
    void logProgress(const char* prefix) const;

    OrchestratorConfig config_;
    service::ProxySupervisor& supervisor_;
    download::Downloader& downloader_;
    storage::StorageSink& sink_;
    repository::ResumableStateStore& store_;
    std::optional<std::regex> idPattern_;
    TransitionListener listener_;

    util::Cancellation cancellation_;
    std::atomic<bool> userCancelled_{false};
    std::atomic<bool> breakerTripped_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> journalFailed_{false};

    std::mutex queueMutex_;
    std::deque<std::string> queue_;

    mutable std::mutex counterMutex_;
    std::size_t scheduled_{};
    std::size_t completed_{};
    std::size_t failed_{};
    std::size_t deferred_{};
    int consecutiveFailures_{};
};

} // namespace bulkfetch::workflow
