#pragma once

#include "bulkfetch/proxy/ProxyPool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bulkfetch::download {
class Downloader;
}

namespace bulkfetch::proxy {

struct ProbeResult {
    bool success{};
    double throughputBytesPerSec{};
    std::chrono::milliseconds latency{std::chrono::milliseconds::max()};
    std::uintmax_t bytes{};
    std::string error;
};

class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    // 不抛异常，任何失败都体现在 ProbeResult 中。
    virtual ProbeResult probe(const ProxyEndpoint& endpoint) = 0;
};

struct ProbeConfig {
    std::string referenceItem;
    std::chrono::seconds timeout{std::chrono::seconds{60}};
    std::chrono::milliseconds connectTimeout{std::chrono::milliseconds{5000}};
    std::uintmax_t minBytes{1024};
    std::uintmax_t maxBytes{0};
    std::filesystem::path scratchDirectory;
};

class DownloaderHealthProbe : public HealthProbe {
public:
    DownloaderHealthProbe(ProbeConfig config, download::Downloader& downloader);

    ProbeResult probe(const ProxyEndpoint& endpoint) override;

private:
    ProbeConfig config_;
    download::Downloader& downloader_;
    std::atomic<std::uint64_t> sequence_{0};
};

std::optional<std::chrono::milliseconds> measureConnectLatency(const ProxyEndpoint& endpoint,
                                                               std::chrono::milliseconds timeout);

} // namespace bulkfetch::proxy
