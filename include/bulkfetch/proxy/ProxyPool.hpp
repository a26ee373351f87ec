#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bulkfetch::proxy {

struct ProxyEndpoint {
    std::string scheme{"http"};
    std::string host;
    std::uint16_t port{};
    std::string username;
    std::string password;

    // scheme://host:port，池内主键，可写入日志和快照。
    [[nodiscard]] std::string key() const;
    // scheme://[user[:pass]@]host:port，只交给下载器使用。
    [[nodiscard]] std::string url() const;
};

bool operator==(const ProxyEndpoint& lhs, const ProxyEndpoint& rhs);

// 接受 "host:port" 或 "scheme://[user:pass@]host:port"，非法条目返回 std::nullopt。
std::optional<ProxyEndpoint> parseProxyUrl(std::string_view text, std::string_view defaultScheme = "http");

enum class ProxyState {
    untested,
    healthy,
    degraded,
    dead
};

const char* toString(ProxyState state);
std::optional<ProxyState> parseProxyState(std::string_view text);

struct ProxyHealth {
    ProxyState state{ProxyState::untested};
    double throughput{};
    std::chrono::milliseconds latency{std::chrono::milliseconds::max()};
    int consecutiveFailures{};
    std::chrono::system_clock::time_point lastChecked{};
    std::chrono::steady_clock::time_point lastUsed{};
    unsigned int inUse{};
};

struct PoolPolicy {
    double minThroughput{1024.0 * 1024.0};
    int deadThreshold{3};
    unsigned int perProxyLimit{2};
    double ewmaAlpha{0.3};
    std::chrono::seconds probeBackoffBase{std::chrono::seconds{60}};
    std::chrono::seconds probeBackoffCap{std::chrono::hours{1}};
};

enum class ReleaseOutcome {
    success,
    failure,
    neutral
};

struct TransferReport {
    ReleaseOutcome outcome{ReleaseOutcome::neutral};
    std::uintmax_t bytes{};
    std::chrono::milliseconds elapsed{};
};

struct PoolEntry {
    ProxyEndpoint endpoint;
    ProxyHealth health;
};

// 不加锁，由 ProxySupervisor 串行访问。
class ProxyPool {
public:
    explicit ProxyPool(PoolPolicy policy);

    bool insert(ProxyEndpoint endpoint, ProxyHealth health = {});
    std::size_t retainOnly(const std::vector<ProxyEndpoint>& upstream);

    std::optional<ProxyEndpoint> select(const std::unordered_set<std::string>& excluded,
                                        std::chrono::steady_clock::time_point now);
    void release(const ProxyEndpoint& endpoint, const TransferReport& report);
    void recordProbe(const std::string& key,
                     bool success,
                     double throughput,
                     std::chrono::milliseconds latency,
                     std::chrono::system_clock::time_point checkedAt);

    std::vector<ProxyEndpoint> dueForProbe(std::chrono::system_clock::time_point now) const;
    std::chrono::seconds probeBackoff(const ProxyHealth& health) const;

    bool contains(const std::string& key) const;
    std::optional<ProxyHealth> health(const std::string& key) const;
    std::vector<PoolEntry> entries() const;
    std::size_t size() const noexcept { return entries_.size(); }
    std::size_t usableCount() const;

    const PoolPolicy& policy() const noexcept { return policy_; }

private:
    bool acquirable(const ProxyHealth& health) const;
    void applyFailure(ProxyHealth& health) const;

    PoolPolicy policy_;
    std::unordered_map<std::string, PoolEntry> entries_;
};

} // namespace bulkfetch::proxy
