#pragma once

#include "bulkfetch/proxy/ProxyPool.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bulkfetch::util {
class HttpClient;
}

namespace bulkfetch::proxy {

struct ProxyListConfig {
    std::string source;
    std::string defaultScheme{"http"};
    std::string username;
    std::string password;
    std::chrono::seconds timeout{std::chrono::seconds{30}};
};

// 拉取失败时抛出异常，由调用方决定如何降级。
class ProxyListSource {
public:
    virtual ~ProxyListSource() = default;
    virtual std::vector<ProxyEndpoint> fetch() = 0;
    virtual std::string describe() const = 0;
};

class HttpProxyListSource : public ProxyListSource {
public:
    HttpProxyListSource(ProxyListConfig config, util::HttpClient& httpClient);

    std::vector<ProxyEndpoint> fetch() override;
    std::string describe() const override { return config_.source; }

private:
    ProxyListConfig config_;
    util::HttpClient& httpClient_;
};

class FileProxyListSource : public ProxyListSource {
public:
    FileProxyListSource(ProxyListConfig config, std::filesystem::path path);

    std::vector<ProxyEndpoint> fetch() override;
    std::string describe() const override { return path_.string(); }

private:
    ProxyListConfig config_;
    std::filesystem::path path_;
};

// 每行（或以 ;,| 分隔）一个条目，支持 JSON 数组 [{"host","port",...}] 或 ["scheme://host:port"]。
std::vector<ProxyEndpoint> parseProxyList(std::string_view body, const ProxyListConfig& config);

// "file://" 前缀或不含 "://" 的来源按本地文件处理。
std::unique_ptr<ProxyListSource> makeProxyListSource(ProxyListConfig config, util::HttpClient& httpClient);

} // namespace bulkfetch::proxy
