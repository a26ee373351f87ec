#include "bulkfetch/proxy/ProxyPool.hpp"

#include "bulkfetch/util/CommonUtil.hpp"

#include <algorithm>
#include <stdexcept>

namespace bulkfetch::proxy {
namespace {

constexpr int kMaxBackoffShift = 20;

bool preferProxy(const PoolEntry& lhs, const PoolEntry& rhs) {
    if (lhs.health.throughput != rhs.health.throughput) {
        return lhs.health.throughput > rhs.health.throughput;
    }
    if (lhs.health.consecutiveFailures != rhs.health.consecutiveFailures) {
        return lhs.health.consecutiveFailures < rhs.health.consecutiveFailures;
    }
    if (lhs.health.lastUsed != rhs.health.lastUsed) {
        return lhs.health.lastUsed < rhs.health.lastUsed;
    }
    return lhs.endpoint.key() < rhs.endpoint.key();
}

} // namespace

std::string ProxyEndpoint::key() const {
    return scheme + "://" + host + ':' + std::to_string(port);
}

std::string ProxyEndpoint::url() const {
    std::string result = scheme + "://";
    if (!username.empty()) {
        result += username;
        if (!password.empty()) {
            result += ':' + password;
        }
        result += '@';
    }
    result += host + ':' + std::to_string(port);
    return result;
}

bool operator==(const ProxyEndpoint& lhs, const ProxyEndpoint& rhs) {
    return lhs.scheme == rhs.scheme && lhs.host == rhs.host && lhs.port == rhs.port &&
           lhs.username == rhs.username && lhs.password == rhs.password;
}

std::optional<ProxyEndpoint> parseProxyUrl(std::string_view text, std::string_view defaultScheme) {
    auto trimmed = util::trimView(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    ProxyEndpoint endpoint;
    endpoint.scheme = util::toLower(defaultScheme);
    if (auto schemeEnd = trimmed.find("://"); schemeEnd != std::string_view::npos) {
        endpoint.scheme = util::toLower(trimmed.substr(0, schemeEnd));
        trimmed = trimmed.substr(schemeEnd + 3);
    }
    if (endpoint.scheme.empty()) {
        return std::nullopt;
    }
    if (auto slash = trimmed.find('/'); slash != std::string_view::npos) {
        trimmed = trimmed.substr(0, slash);
    }

    if (auto at = trimmed.rfind('@'); at != std::string_view::npos) {
        auto credentials = trimmed.substr(0, at);
        trimmed = trimmed.substr(at + 1);
        auto colon = credentials.find(':');
        endpoint.username = std::string(credentials.substr(0, colon));
        if (colon != std::string_view::npos) {
            endpoint.password = std::string(credentials.substr(colon + 1));
        }
    }

    auto colon = trimmed.rfind(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    auto hostView = util::trimView(trimmed.substr(0, colon));
    auto portView = util::trimView(trimmed.substr(colon + 1));
    if (hostView.empty() || portView.empty()) {
        return std::nullopt;
    }

    unsigned long portValue = 0;
    try {
        std::size_t consumed = 0;
        portValue = std::stoul(std::string(portView), &consumed);
        if (consumed != portView.size()) {
            return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (portValue == 0 || portValue > 65535) {
        return std::nullopt;
    }

    endpoint.host = std::string(hostView);
    endpoint.port = static_cast<std::uint16_t>(portValue);
    return endpoint;
}

const char* toString(ProxyState state) {
    switch (state) {
    case ProxyState::untested: return "UNTESTED";
    case ProxyState::healthy: return "HEALTHY";
    case ProxyState::degraded: return "DEGRADED";
    case ProxyState::dead: return "DEAD";
    }
    return "UNTESTED";
}

std::optional<ProxyState> parseProxyState(std::string_view text) {
    if (text == "UNTESTED") return ProxyState::untested;
    if (text == "HEALTHY") return ProxyState::healthy;
    if (text == "DEGRADED") return ProxyState::degraded;
    if (text == "DEAD") return ProxyState::dead;
    return std::nullopt;
}

ProxyPool::ProxyPool(PoolPolicy policy)
    : policy_(policy) {
    if (policy_.perProxyLimit == 0) {
        policy_.perProxyLimit = 1;
    }
    if (policy_.deadThreshold < 0) {
        policy_.deadThreshold = 0;
    }
    policy_.ewmaAlpha = std::clamp(policy_.ewmaAlpha, 0.0, 1.0);
}

bool ProxyPool::insert(ProxyEndpoint endpoint, ProxyHealth health) {
    auto key = endpoint.key();
    if (auto it = entries_.find(key); it != entries_.end()) {
        // 同一地址换了凭据时以新凭据为准。
        it->second.endpoint.username = std::move(endpoint.username);
        it->second.endpoint.password = std::move(endpoint.password);
        return false;
    }
    health.inUse = 0;
    entries_.emplace(std::move(key), PoolEntry{std::move(endpoint), health});
    return true;
}

std::size_t ProxyPool::retainOnly(const std::vector<ProxyEndpoint>& upstream) {
    std::unordered_set<std::string> keep;
    keep.reserve(upstream.size());
    for (const auto& endpoint : upstream) {
        keep.insert(endpoint.key());
    }

    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& health = it->second.health;
        const bool busyAndHealthy = health.state == ProxyState::healthy && health.inUse > 0;
        if (keep.count(it->first) == 0 && !busyAndHealthy) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool ProxyPool::acquirable(const ProxyHealth& health) const {
    return health.state == ProxyState::healthy &&
           health.consecutiveFailures <= policy_.deadThreshold &&
           health.throughput >= policy_.minThroughput &&
           health.inUse < policy_.perProxyLimit;
}

std::optional<ProxyEndpoint> ProxyPool::select(const std::unordered_set<std::string>& excluded,
                                               std::chrono::steady_clock::time_point now) {
    PoolEntry* best = nullptr;
    for (auto& [key, entry] : entries_) {
        if (!acquirable(entry.health) || excluded.count(key) != 0) {
            continue;
        }
        if (!best || preferProxy(entry, *best)) {
            best = &entry;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    best->health.inUse += 1;
    best->health.lastUsed = now;
    return best->endpoint;
}

void ProxyPool::applyFailure(ProxyHealth& health) const {
    health.consecutiveFailures += 1;
    if (health.consecutiveFailures > policy_.deadThreshold) {
        health.state = ProxyState::dead;
    }
}

void ProxyPool::release(const ProxyEndpoint& endpoint, const TransferReport& report) {
    auto it = entries_.find(endpoint.key());
    if (it == entries_.end()) {
        return;
    }
    auto& health = it->second.health;
    if (health.inUse > 0) {
        health.inUse -= 1;
    }

    switch (report.outcome) {
    case ReleaseOutcome::failure:
        applyFailure(health);
        break;
    case ReleaseOutcome::success: {
        health.consecutiveFailures = 0;
        if (report.elapsed.count() > 0) {
            const double observed = static_cast<double>(report.bytes) * 1000.0 /
                                    static_cast<double>(report.elapsed.count());
            health.throughput = health.throughput <= 0.0
                                    ? observed
                                    : policy_.ewmaAlpha * observed + (1.0 - policy_.ewmaAlpha) * health.throughput;
        }
        if (health.state == ProxyState::healthy && health.throughput < policy_.minThroughput) {
            health.state = ProxyState::degraded;
        }
        break;
    }
    case ReleaseOutcome::neutral:
        break;
    }
}

void ProxyPool::recordProbe(const std::string& key,
                            bool success,
                            double throughput,
                            std::chrono::milliseconds latency,
                            std::chrono::system_clock::time_point checkedAt) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    auto& health = it->second.health;
    health.lastChecked = checkedAt;
    if (!success) {
        applyFailure(health);
        if (health.state != ProxyState::dead) {
            health.state = ProxyState::degraded;
        }
        return;
    }
    health.consecutiveFailures = 0;
    health.throughput = throughput;
    health.latency = latency;
    health.state = throughput >= policy_.minThroughput ? ProxyState::healthy : ProxyState::degraded;
}

std::chrono::seconds ProxyPool::probeBackoff(const ProxyHealth& health) const {
    const int shift = std::clamp(health.consecutiveFailures, 0, kMaxBackoffShift);
    const auto scaled = policy_.probeBackoffBase * (std::int64_t{1} << shift);
    return std::min(scaled, policy_.probeBackoffCap);
}

std::vector<ProxyEndpoint> ProxyPool::dueForProbe(std::chrono::system_clock::time_point now) const {
    std::vector<ProxyEndpoint> due;
    for (const auto& [key, entry] : entries_) {
        const auto& health = entry.health;
        switch (health.state) {
        case ProxyState::untested:
            due.push_back(entry.endpoint);
            break;
        case ProxyState::degraded:
        case ProxyState::dead:
            if (health.lastChecked + probeBackoff(health) <= now) {
                due.push_back(entry.endpoint);
            }
            break;
        case ProxyState::healthy:
            break;
        }
    }
    return due;
}

bool ProxyPool::contains(const std::string& key) const {
    return entries_.count(key) != 0;
}

std::optional<ProxyHealth> ProxyPool::health(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.health;
}

std::vector<PoolEntry> ProxyPool::entries() const {
    std::vector<PoolEntry> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(entry);
    }
    std::sort(result.begin(), result.end(), [](const PoolEntry& lhs, const PoolEntry& rhs) {
        return lhs.endpoint.key() < rhs.endpoint.key();
    });
    return result;
}

std::size_t ProxyPool::usableCount() const {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(), [this](const auto& item) {
        const auto& health = item.second.health;
        return health.state == ProxyState::healthy && health.throughput >= policy_.minThroughput;
    }));
}

} // namespace bulkfetch::proxy
