#include "bulkfetch/workflow/DownloadOrchestrator.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace bulkfetch::workflow {
namespace {

void removeScratch(const std::filesystem::path& workDirectory, const std::string& itemId) {
    if (!model::isSafeItemId(itemId)) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(workDirectory / itemId, ec);
}

std::chrono::milliseconds retryDelay(const OrchestratorConfig& config, int attempt) {
    auto delay = config.retryBackoff;
    for (int i = 1; i < attempt && delay < config.retryBackoffCap; ++i) {
        delay *= 2;
    }
    return std::min(delay, config.retryBackoffCap);
}

} // namespace

const char* toString(TaskState state) {
    switch (state) {
    case TaskState::pending: return "PENDING";
    case TaskState::acquiring_proxy: return "ACQUIRING_PROXY";
    case TaskState::downloading: return "DOWNLOADING";
    case TaskState::retrying: return "RETRYING";
    case TaskState::succeeded: return "SUCCEEDED";
    case TaskState::failed: return "FAILED";
    }
    return "PENDING";
}

DownloadOrchestrator::DownloadOrchestrator(OrchestratorConfig config,
                                           service::ProxySupervisor& supervisor,
                                           download::Downloader& downloader,
                                           storage::StorageSink& sink,
                                           repository::ResumableStateStore& store)
    : config_(std::move(config))
    , supervisor_(supervisor)
    , downloader_(downloader)
    , sink_(sink)
    , store_(store) {
    if (config_.maxConcurrent == 0) {
        throw std::invalid_argument("maxConcurrent must be positive");
    }
    if (config_.maxRetries < 0) {
        throw std::invalid_argument("maxRetries must not be negative");
    }
    if (config_.errorThreshold <= 0) {
        throw std::invalid_argument("errorThreshold must be positive");
    }
    if (!config_.idPattern.empty()) {
        idPattern_.emplace(config_.idPattern);
    }
}

void DownloadOrchestrator::setTransitionListener(TransitionListener listener) {
    listener_ = std::move(listener);
}

void DownloadOrchestrator::cancel() {
    if (!userCancelled_.exchange(true)) {
        util::log(util::LogLevel::warn, "收到取消请求，停止调度新任务，等待进行中的下载结束");
    }
    cancellation_.cancel();
}

RunSummary DownloadOrchestrator::run(const std::vector<std::string>& itemIds) {
    if (started_.exchange(true)) {
        throw std::logic_error("DownloadOrchestrator::run may only be called once");
    }

    std::vector<std::string> unique;
    unique.reserve(itemIds.size());
    {
        std::unordered_set<std::string> seen;
        for (const auto& id : itemIds) {
            if (seen.insert(id).second) {
                unique.push_back(id);
            }
        }
    }

    RunSummary summary;
    summary.total = unique.size();
    auto pending = store_.filterPending(unique);
    summary.skipped = unique.size() - pending.size();
    pending = skipStored(std::move(pending), summary.skipped);

    {
        std::scoped_lock lock(queueMutex_);
        queue_.assign(pending.begin(), pending.end());
    }
    {
        std::scoped_lock lock(counterMutex_);
        scheduled_ = pending.size();
    }

    util::log(util::LogLevel::info,
              "开始下载: 共 " + std::to_string(summary.total) + " 个，已完成跳过 " +
                  std::to_string(summary.skipped) + " 个，待处理 " + std::to_string(pending.size()) +
                  " 个，并发 " + std::to_string(config_.maxConcurrent));

    if (!pending.empty()) {
        const auto workers = std::min<std::size_t>(config_.maxConcurrent, pending.size());
        boost::asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            boost::asio::post(pool, [this]() { workerLoop(); });
        }
        pool.join();
    }

    {
        std::scoped_lock lock(counterMutex_);
        summary.completed = completed_;
        summary.failed = failed_;
        summary.deferred = deferred_;
    }
    summary.pending = summary.total - summary.skipped - summary.completed - summary.failed;
    summary.breakerTripped = breakerTripped_;
    summary.cancelled = userCancelled_;
    summary.journalFailed = journalFailed_;

    logProgress("下载结束");
    if (summary.breakerTripped) {
        util::log(util::LogLevel::error,
                  "连续失败达到阈值 " + std::to_string(config_.errorThreshold) + "，已中止本次运行");
    }
    if (summary.deferred > 0) {
        util::log(util::LogLevel::warn,
                  std::to_string(summary.deferred) + " 个条目因长时间没有可用代理而保留为待处理，下次运行继续");
    }
    return summary;
}

std::vector<std::string> DownloadOrchestrator::skipStored(std::vector<std::string> pending, std::size_t& skipped) {
    if (pending.empty()) {
        return pending;
    }
    std::unordered_set<std::string> stored;
    try {
        stored = sink_.storedItems();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"查询存储中已有条目失败，按未下载处理: "} + ex.what());
        return pending;
    }
    if (stored.empty()) {
        return pending;
    }

    std::vector<std::string> remaining;
    remaining.reserve(pending.size());
    std::size_t found = 0;
    for (auto& id : pending) {
        if (stored.count(id) != 0 && recordState("COMPLETE", id, [&]() { store_.markComplete(id); })) {
            ++found;
        } else {
            remaining.push_back(std::move(id));
        }
    }
    if (found > 0) {
        util::log(util::LogLevel::info, "存储中已存在 " + std::to_string(found) + " 个条目，标记完成并跳过");
    }
    skipped += found;
    return remaining;
}

void DownloadOrchestrator::workerLoop() {
    while (auto itemId = nextItem()) {
        TaskOutcome outcome = TaskOutcome::failed;
        try {
            outcome = processTask(*itemId);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, "任务异常 id=" + *itemId + " error=" + ex.what());
            outcome = failTask(*itemId, model::Failure{model::FailureKind::internal, ex.what()}, 0);
        }
        finishTask(*itemId, outcome);
    }
}

std::optional<std::string> DownloadOrchestrator::nextItem() {
    if (stopping()) {
        return std::nullopt;
    }
    std::scoped_lock lock(queueMutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto id = std::move(queue_.front());
    queue_.pop_front();
    return id;
}

DownloadOrchestrator::TaskOutcome DownloadOrchestrator::processTask(const std::string& itemId) {
    notify(itemId, TaskState::pending, 0);

    if (!model::isSafeItemId(itemId)) {
        return failTask(itemId, model::Failure{model::FailureKind::malformed_id, "id is not usable as a file name"},
                        0);
    }
    if (idPattern_ && !std::regex_match(itemId, *idPattern_)) {
        return failTask(itemId, model::Failure{model::FailureKind::malformed_id, "id does not match pattern"}, 0);
    }

    if (!recordState("IN_PROGRESS", itemId, [&]() { store_.markInProgress(itemId); })) {
        return TaskOutcome::abandoned;
    }

    model::DownloadTask task;
    task.itemId = itemId;
    task.workDirectory = config_.workDirectory;
    task.constraints = config_.constraints;
    task.timeout = config_.downloadTimeout;

    // 失败过的代理不再用于同一条目。
    std::unordered_set<std::string> excluded;
    int attempt = 0;
    while (true) {
        if (stopping()) {
            return returnToPending(itemId, TaskOutcome::abandoned);
        }

        ++attempt;
        notify(itemId, TaskState::acquiring_proxy, attempt);
        auto proxy = acquireProxy(itemId, excluded);
        if (!proxy) {
            if (stopping()) {
                return returnToPending(itemId, TaskOutcome::abandoned);
            }
            util::log(util::LogLevel::warn,
                      "等待 " + std::to_string(config_.proxyWaitLimit.count()) +
                          "s 仍无可用代理，条目保留为待处理 id=" + itemId + " 已排除代理=" +
                          std::to_string(excluded.size()));
            return returnToPending(itemId, TaskOutcome::deferred);
        }

        notify(itemId, TaskState::downloading, attempt);
        model::FetchResult fetched;
        try {
            fetched = downloader_.fetch(task, *proxy);
        } catch (const std::exception& ex) {
            fetched = model::FetchResult::failed(model::FailureKind::internal, ex.what());
        }

        proxy::TransferReport report;
        if (fetched.status == model::FetchStatus::success) {
            report.outcome = proxy::ReleaseOutcome::success;
            report.bytes = fetched.artifact.bytes;
            report.elapsed = fetched.artifact.elapsed;
        } else if (model::penalizesProxy(fetched.failure.kind)) {
            report.outcome = proxy::ReleaseOutcome::failure;
        } else {
            report.outcome = proxy::ReleaseOutcome::neutral;
        }
        supervisor_.release(*proxy, report);

        const auto tried = model::makeAttempt(attempt, proxy->key(), fetched);
        util::log(util::LogLevel::debug,
                  "尝试结束 id=" + itemId + " #" + std::to_string(tried.number) + " 代理=" + tried.proxyKey +
                      " 结果=" + model::toString(tried.outcome) +
                      (tried.outcome == model::AttemptOutcome::success ? "" : " " + model::describe(tried.failure)));

        model::Failure failure;
        if (fetched.status == model::FetchStatus::success) {
            auto stored = sink_.store(itemId, fetched.artifact, fetched.artifact.metadata);
            if (stored.success) {
                removeScratch(config_.workDirectory, itemId);
                if (!recordState("COMPLETE", itemId, [&]() { store_.markComplete(itemId, attempt); })) {
                    util::log(util::LogLevel::error, "已保存但未能记录完成状态，下次运行将重新处理 id=" + itemId);
                    return TaskOutcome::abandoned;
                }
                notify(itemId, TaskState::succeeded, attempt);
                util::log(util::LogLevel::info,
                          "下载完成 id=" + itemId + " 大小=" +
                              util::formatBytes(static_cast<double>(fetched.artifact.bytes)) +
                              " 尝试=" + std::to_string(attempt));
                return TaskOutcome::succeeded;
            }
            failure = model::Failure{model::FailureKind::storage_transient, stored.error};
        } else {
            failure = fetched.failure;
            if (model::penalizesProxy(failure.kind)) {
                excluded.insert(proxy->key());
            }
        }

        if (!model::isRetryable(failure.kind) || attempt > config_.maxRetries) {
            return failTask(itemId, failure, attempt);
        }

        const auto delay = retryDelay(config_, attempt);
        util::log(util::LogLevel::warn,
                  "下载失败 id=" + itemId + " 尝试=" + std::to_string(attempt) + "/" +
                      std::to_string(config_.maxRetries + 1) + " " + model::describe(failure) + "，" +
                      std::to_string(delay.count()) + "ms 后重试");
        notify(itemId, TaskState::retrying, attempt);
        if (!cancellation_.sleepFor(delay)) {
            return returnToPending(itemId, TaskOutcome::abandoned);
        }
    }
}

std::optional<proxy::ProxyEndpoint> DownloadOrchestrator::acquireProxy(
    const std::string& itemId,
    const std::unordered_set<std::string>& excluded) {
    const auto deadline = std::chrono::steady_clock::now() + config_.proxyWaitLimit;
    auto backoff = config_.acquireBackoffInitial;

    while (!stopping()) {
        try {
            return supervisor_.acquire(excluded);
        } catch (const service::NoHealthyProxyError&) {
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        const auto wait = std::min(backoff, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        util::log(util::LogLevel::debug,
                  "暂无可用代理 id=" + itemId + "，等待 " + std::to_string(wait.count()) + "ms");
        if (!cancellation_.sleepFor(wait)) {
            break;
        }
        backoff = std::min(backoff * 2, config_.acquireBackoffCap);
    }
    return std::nullopt;
}

DownloadOrchestrator::TaskOutcome DownloadOrchestrator::failTask(const std::string& itemId,
                                                                 const model::Failure& failure,
                                                                 int attempts) {
    const auto reason = model::describe(failure);
    recordState("FAILED", itemId, [&]() { store_.markFailed(itemId, reason, attempts); });
    removeScratch(config_.workDirectory, itemId);
    notify(itemId, TaskState::failed, attempts);
    util::log(util::LogLevel::error, "下载失败 id=" + itemId + " 原因=" + reason);
    return TaskOutcome::failed;
}

DownloadOrchestrator::TaskOutcome DownloadOrchestrator::returnToPending(const std::string& itemId,
                                                                        TaskOutcome outcome) {
    // 日志已不可写时磁盘上的 IN_PROGRESS 在下次 open() 时同样恢复为 PENDING。
    if (!journalFailed_) {
        recordState("PENDING", itemId, [&]() { store_.markPending(itemId); });
    }
    removeScratch(config_.workDirectory, itemId);
    return outcome;
}

bool DownloadOrchestrator::recordState(const char* action,
                                       const std::string& itemId,
                                       const std::function<void()>& write) {
    try {
        write();
        return true;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error,
                  std::string{"状态写入失败 "} + action + " id=" + itemId + " error=" + ex.what());
    }
    if (!journalFailed_.exchange(true)) {
        util::log(util::LogLevel::error, "状态日志不可写，停止调度新任务: " + store_.path().string());
    }
    cancellation_.cancel();
    return false;
}

void DownloadOrchestrator::finishTask(const std::string& itemId, TaskOutcome outcome) {
    bool trip = false;
    bool report = false;
    {
        std::scoped_lock lock(counterMutex_);
        switch (outcome) {
        case TaskOutcome::succeeded:
            ++completed_;
            consecutiveFailures_ = 0;
            break;
        case TaskOutcome::failed:
            ++failed_;
            ++consecutiveFailures_;
            if (consecutiveFailures_ >= config_.errorThreshold && !breakerTripped_) {
                breakerTripped_ = true;
                trip = true;
            }
            break;
        case TaskOutcome::deferred:
            ++deferred_;
            return;
        case TaskOutcome::abandoned:
            return;
        }
        const auto finished = completed_ + failed_;
        report = config_.progressInterval > 0 && finished % config_.progressInterval == 0;
    }

    if (trip) {
        util::log(util::LogLevel::error,
                  "连续 " + std::to_string(config_.errorThreshold) + " 个任务失败，熔断 (最后失败 id=" + itemId + ")");
        cancellation_.cancel();
    }
    if (report) {
        logProgress("进度");
    }
}

void DownloadOrchestrator::notify(const std::string& itemId, TaskState state, int attempt) const {
    if (!listener_) {
        return;
    }
    try {
        listener_(itemId, state, attempt);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"状态监听器异常: "} + ex.what());
    }
}

bool DownloadOrchestrator::stopping() const {
    return cancellation_.cancelled();
}

void DownloadOrchestrator::logProgress(const char* prefix) const {
    std::size_t scheduled = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    {
        std::scoped_lock lock(counterMutex_);
        scheduled = scheduled_;
        completed = completed_;
        failed = failed_;
    }
    util::log(util::LogLevel::info,
              std::string{prefix} + ": 完成 " + std::to_string(completed) + " 失败 " + std::to_string(failed) +
                  " 待处理 " + std::to_string(scheduled - completed - failed) + " 可用代理 " +
                  std::to_string(supervisor_.usableCount()));
}

} // namespace bulkfetch::workflow
