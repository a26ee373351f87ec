#include "bulkfetch/service/ProxySupervisor.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/JsonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace bulkfetch::service {
namespace {

struct StateCounts {
    std::size_t healthy{};
    std::size_t degraded{};
    std::size_t dead{};
    std::size_t untested{};
};

StateCounts countStates(const std::vector<proxy::PoolEntry>& entries) {
    StateCounts counts;
    for (const auto& entry : entries) {
        switch (entry.health.state) {
        case proxy::ProxyState::healthy: ++counts.healthy; break;
        case proxy::ProxyState::degraded: ++counts.degraded; break;
        case proxy::ProxyState::dead: ++counts.dead; break;
        case proxy::ProxyState::untested: ++counts.untested; break;
        }
    }
    return counts;
}

std::string describeCounts(const StateCounts& counts) {
    return "[H:" + std::to_string(counts.healthy) + " D:" + std::to_string(counts.degraded) +
           " X:" + std::to_string(counts.dead) + " U:" + std::to_string(counts.untested) + "]";
}

} // namespace

ProxySupervisor::ProxySupervisor(SupervisorConfig config,
                                 proxy::ProxyListSource& source,
                                 proxy::HealthProbe& probe)
    : config_(std::move(config))
    , source_(source)
    , probe_(probe)
    , pool_(config_.policy) {
    if (config_.probeConcurrency == 0) {
        config_.probeConcurrency = 1;
    }
}

ProxySupervisor::~ProxySupervisor() {
    running_ = false;
}

std::size_t ProxySupervisor::refresh() {
    std::vector<proxy::ProxyEndpoint> upstream;
    try {
        upstream = source_.fetch();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"刷新代理列表失败，保留现有代理池: "} + ex.what());
        return 0;
    }
    if (upstream.empty()) {
        util::log(util::LogLevel::warn, "代理列表为空，保留现有代理池: " + source_.describe());
        return 0;
    }

    std::size_t added = 0;
    std::size_t removed = 0;
    std::size_t total = 0;
    {
        std::scoped_lock lock(poolMutex_);
        removed = pool_.retainOnly(upstream);
        for (auto& endpoint : upstream) {
            if (pool_.insert(std::move(endpoint))) {
                ++added;
            }
        }
        total = pool_.size();
    }
    util::log(util::LogLevel::info,
              "代理池刷新完成: 新增 " + std::to_string(added) + " 移除 " + std::to_string(removed) +
                  " 当前 " + std::to_string(total));
    return added;
}

std::size_t ProxySupervisor::probeAll() {
    std::scoped_lock probeLock(probeMutex_);
    if (halted_) {
        return 0;
    }

    std::vector<proxy::ProxyEndpoint> due;
    {
        std::scoped_lock lock(poolMutex_);
        due = pool_.dueForProbe(std::chrono::system_clock::now());
    }
    if (due.empty()) {
        return 0;
    }

    util::log(util::LogLevel::info, "开始测试 " + std::to_string(due.size()) + " 个代理");
    std::atomic<std::size_t> skipped{0};
    {
        const auto threads = static_cast<std::size_t>(config_.probeConcurrency);
        boost::asio::thread_pool workers(std::min(threads, due.size()));
        for (const auto& endpoint : due) {
            boost::asio::post(workers, [this, endpoint, &skipped]() {
                if (halted_) {
                    ++skipped;
                    return;
                }
                proxy::ProbeResult result;
                try {
                    result = probe_.probe(endpoint);
                } catch (const std::exception& ex) {
                    result.success = false;
                    result.error = ex.what();
                }

                const auto key = endpoint.key();
                std::optional<proxy::ProxyHealth> updated;
                {
                    std::scoped_lock lock(poolMutex_);
                    pool_.recordProbe(key, result.success, result.throughputBytesPerSec, result.latency,
                                      std::chrono::system_clock::now());
                    updated = pool_.health(key);
                }
                if (!updated) {
                    return;
                }
                if (result.success) {
                    util::log(util::LogLevel::debug,
                              "代理 " + key + " " + proxy::toString(updated->state) + " " +
                                  util::formatBytes(result.throughputBytesPerSec) + "/s latency=" +
                                  std::to_string(result.latency.count()) + "ms");
                } else {
                    util::log(util::LogLevel::debug,
                              "代理 " + key + " " + proxy::toString(updated->state) + " 测试失败: " + result.error);
                }
            });
        }
        workers.join();
    }
    if (skipped > 0) {
        util::log(util::LogLevel::warn, "代理测试被中断，跳过 " + std::to_string(skipped.load()) + " 个");
    }

    util::log(util::LogLevel::info, "代理测试完成 " + describeCounts(countStates(snapshot())));
    saveSnapshot();
    return due.size() - skipped;
}

std::optional<proxy::ProxyEndpoint> ProxySupervisor::tryAcquire(const std::unordered_set<std::string>& excluded) {
    std::scoped_lock lock(poolMutex_);
    return pool_.select(excluded, std::chrono::steady_clock::now());
}

proxy::ProxyEndpoint ProxySupervisor::acquire(const std::unordered_set<std::string>& excluded) {
    if (auto endpoint = tryAcquire(excluded)) {
        return *endpoint;
    }
    throw NoHealthyProxyError("no healthy proxy available");
}

void ProxySupervisor::release(const proxy::ProxyEndpoint& endpoint, const proxy::TransferReport& report) {
    std::optional<proxy::ProxyHealth> before;
    std::optional<proxy::ProxyHealth> after;
    {
        std::scoped_lock lock(poolMutex_);
        const auto key = endpoint.key();
        before = pool_.health(key);
        pool_.release(endpoint, report);
        after = pool_.health(key);
    }
    if (before && after && before->state != after->state) {
        util::log(after->state == proxy::ProxyState::dead ? util::LogLevel::warn : util::LogLevel::info,
                  "代理 " + endpoint.host + ":" + std::to_string(endpoint.port) + " 状态 " +
                      proxy::toString(before->state) + " -> " + proxy::toString(after->state));
    }
}

void ProxySupervisor::start(boost::asio::io_context& io) {
    timer_ = std::make_unique<boost::asio::steady_timer>(io);
    running_ = true;
    scheduleCycle();
}

void ProxySupervisor::stop() {
    running_ = false;
    if (timer_) {
        boost::asio::post(timer_->get_executor(), [this]() {
            if (timer_) {
                timer_->cancel();
            }
        });
    }
}

void ProxySupervisor::interrupt() {
    halted_ = true;
    stop();
}

void ProxySupervisor::scheduleCycle() {
    if (!running_ || halted_ || !timer_) {
        return;
    }
    timer_->expires_after(config_.refreshInterval);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (!ec && running_ && !halted_) {
            runCycle();
            scheduleCycle();
        }
    });
}

void ProxySupervisor::runCycle() {
    try {
        refresh();
        if (halted_) {
            return;
        }
        probeAll();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"代理维护周期异常: "} + ex.what());
    }
}

void ProxySupervisor::addProxies(std::vector<proxy::ProxyEndpoint> proxies) {
    std::scoped_lock lock(poolMutex_);
    for (auto& endpoint : proxies) {
        pool_.insert(std::move(endpoint));
    }
}

std::vector<proxy::PoolEntry> ProxySupervisor::snapshot() const {
    std::scoped_lock lock(poolMutex_);
    return pool_.entries();
}

std::optional<proxy::ProxyHealth> ProxySupervisor::health(const proxy::ProxyEndpoint& endpoint) const {
    std::scoped_lock lock(poolMutex_);
    return pool_.health(endpoint.key());
}

std::size_t ProxySupervisor::usableCount() const {
    std::scoped_lock lock(poolMutex_);
    return pool_.usableCount();
}

std::size_t ProxySupervisor::loadSnapshot() {
    if (config_.snapshotPath.empty()) {
        return 0;
    }

    std::optional<boost::json::value> json;
    try {
        json = util::readJsonFile(config_.snapshotPath);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"读取代理状态快照失败，忽略: "} + ex.what());
        return 0;
    }
    if (!json || !json->is_object()) {
        return 0;
    }

    const auto now = std::chrono::system_clock::now();
    std::size_t loaded = 0;
    std::scoped_lock lock(poolMutex_);
    for (const auto& [key, value] : json->as_object()) {
        if (!value.is_object()) {
            continue;
        }
        auto endpoint = proxy::parseProxyUrl(std::string(key));
        if (!endpoint) {
            continue;
        }
        if (endpoint->username.empty() && endpoint->password.empty()) {
            endpoint->username = config_.proxyUsername;
            endpoint->password = config_.proxyPassword;
        }
        const auto& obj = value.as_object();
        proxy::ProxyHealth health;
        health.state = proxy::parseProxyState(util::getString(obj, "state").value_or("UNTESTED"))
                           .value_or(proxy::ProxyState::untested);
        health.throughput = util::getDouble(obj, "throughput").value_or(0.0);
        health.consecutiveFailures = static_cast<int>(util::getInt(obj, "consecutiveFailures").value_or(0));
        if (auto latency = util::getInt(obj, "latencyMs")) {
            health.latency = std::chrono::milliseconds{*latency};
        }
        health.lastChecked = util::fromEpochMillis(util::getInt(obj, "lastChecked").value_or(0));
        if (health.state == proxy::ProxyState::healthy && now - health.lastChecked > config_.snapshotMaxAge) {
            health.state = proxy::ProxyState::untested;
        }
        if (pool_.insert(std::move(*endpoint), health)) {
            ++loaded;
        }
    }
    util::log(util::LogLevel::info, "从快照恢复 " + std::to_string(loaded) + " 个代理状态");
    return loaded;
}

void ProxySupervisor::saveSnapshot() const {
    if (config_.snapshotPath.empty()) {
        return;
    }

    boost::json::object root;
    for (const auto& entry : snapshot()) {
        boost::json::object item;
        item["state"] = proxy::toString(entry.health.state);
        item["throughput"] = entry.health.throughput;
        item["consecutiveFailures"] = entry.health.consecutiveFailures;
        if (entry.health.latency != std::chrono::milliseconds::max()) {
            item["latencyMs"] = static_cast<std::int64_t>(entry.health.latency.count());
        }
        item["lastChecked"] = util::toEpochMillis(entry.health.lastChecked);
        root[entry.endpoint.key()] = std::move(item);
    }

    std::scoped_lock lock(snapshotFileMutex_);
    try {
        std::filesystem::create_directories(config_.snapshotPath.parent_path());
        auto temp = config_.snapshotPath;
        temp += ".tmp";
        {
            std::ofstream ofs(temp, std::ios::trunc);
            if (!ofs.is_open()) {
                throw std::runtime_error("cannot open " + temp.string());
            }
            ofs << util::stringifyJson(root);
            if (!ofs.good()) {
                throw std::runtime_error("write failed for " + temp.string());
            }
        }
        std::filesystem::rename(temp, config_.snapshotPath);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"保存代理状态快照失败: "} + ex.what());
    }
}

} // namespace bulkfetch::service
