#pragma once

#include "bulkfetch/proxy/HealthProbe.hpp"
#include "bulkfetch/proxy/ProxyListClient.hpp"
#include "bulkfetch/proxy/ProxyPool.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace bulkfetch::service {

class NoHealthyProxyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SupervisorConfig {
    proxy::PoolPolicy policy;
    unsigned int probeConcurrency{8};
    std::chrono::minutes refreshInterval{std::chrono::minutes{10}};
    std::filesystem::path snapshotPath;
    std::chrono::seconds snapshotMaxAge{std::chrono::hours{1}};
    // 快照不保存凭据，恢复时套用这里的账号。
    std::string proxyUsername;
    std::string proxyPassword;
};

class ProxySupervisor {
public:
    ProxySupervisor(SupervisorConfig config,
                    proxy::ProxyListSource& source,
                    proxy::HealthProbe& probe);
    ~ProxySupervisor();

    ProxySupervisor(const ProxySupervisor&) = delete;
    ProxySupervisor& operator=(const ProxySupervisor&) = delete;

    std::size_t refresh();
    std::size_t probeAll();

    proxy::ProxyEndpoint acquire(const std::unordered_set<std::string>& excluded = {});
    std::optional<proxy::ProxyEndpoint> tryAcquire(const std::unordered_set<std::string>& excluded = {});
    void release(const proxy::ProxyEndpoint& endpoint, const proxy::TransferReport& report);

    void start(boost::asio::io_context& io);
    void stop();
    // 停止后续测试与维护周期，可在信号处理中调用；正在进行的单个测试不被打断。
    void interrupt();
    bool interrupted() const noexcept { return halted_; }

    std::size_t loadSnapshot();
    void saveSnapshot() const;

    void addProxies(std::vector<proxy::ProxyEndpoint> proxies);
    std::vector<proxy::PoolEntry> snapshot() const;
    std::optional<proxy::ProxyHealth> health(const proxy::ProxyEndpoint& endpoint) const;
    std::size_t usableCount() const;

    const SupervisorConfig& config() const noexcept { return config_; }

private:
    void scheduleCycle();
    void runCycle();

    SupervisorConfig config_;
    proxy::ProxyListSource& source_;
    proxy::HealthProbe& probe_;

    mutable std::mutex poolMutex_;
    proxy::ProxyPool pool_;

    std::mutex probeMutex_;
    mutable std::mutex snapshotFileMutex_;

    std::unique_ptr<boost::asio::steady_timer> timer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> halted_{false};
};

} // namespace bulkfetch::service
