#include "bulkfetch/proxy/ProxyListClient.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/HttpClient.hpp"
#include "bulkfetch/util/JsonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace bulkfetch::proxy {
namespace {

void applyDefaults(ProxyEndpoint& endpoint, const ProxyListConfig& config) {
    if (endpoint.username.empty() && endpoint.password.empty()) {
        endpoint.username = config.username;
        endpoint.password = config.password;
    }
}

void appendUnique(std::vector<ProxyEndpoint>& proxies,
                  std::unordered_set<std::string>& seen,
                  ProxyEndpoint endpoint) {
    if (seen.insert(endpoint.key()).second) {
        proxies.push_back(std::move(endpoint));
    }
}

std::vector<ProxyEndpoint> parseJsonList(const boost::json::array& items, const ProxyListConfig& config) {
    std::vector<ProxyEndpoint> proxies;
    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (item.is_string()) {
            if (auto endpoint = parseProxyUrl(std::string(item.as_string()), config.defaultScheme)) {
                applyDefaults(*endpoint, config);
                appendUnique(proxies, seen, std::move(*endpoint));
            }
            continue;
        }
        if (!item.is_object()) {
            continue;
        }
        const auto& obj = item.as_object();
        auto host = util::getString(obj, "host");
        auto port = util::getInt(obj, "port");
        if (!host || host->empty() || !port || *port <= 0 || *port > 65535) {
            util::log(util::LogLevel::warn, "跳过非法代理条目: " + util::stringifyJson(item));
            continue;
        }
        ProxyEndpoint endpoint;
        endpoint.scheme = util::toLower(util::getString(obj, "scheme").value_or(config.defaultScheme));
        endpoint.host = *host;
        endpoint.port = static_cast<std::uint16_t>(*port);
        endpoint.username = util::getString(obj, "username").value_or("");
        endpoint.password = util::getString(obj, "password").value_or("");
        applyDefaults(endpoint, config);
        appendUnique(proxies, seen, std::move(endpoint));
    }
    return proxies;
}

} // namespace

std::vector<ProxyEndpoint> parseProxyList(std::string_view body, const ProxyListConfig& config) {
    auto trimmedBody = util::trimView(body);
    if (!trimmedBody.empty() && trimmedBody.front() == '[') {
        try {
            auto json = util::parseJson(std::string(trimmedBody));
            if (json.is_array()) {
                return parseJsonList(json.as_array(), config);
            }
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, std::string{"代理列表 JSON 解析失败，按文本处理: "} + ex.what());
        }
    }

    std::vector<ProxyEndpoint> proxies;
    std::unordered_set<std::string> seen;
    std::size_t start = 0;
    while (start < body.size()) {
        auto pos = body.find_first_of("\r\n;,|", start);
        auto length = (pos == std::string_view::npos) ? body.size() - start : pos - start;
        auto chunk = body.substr(start, length);
        start = (pos == std::string_view::npos) ? body.size() : pos + 1;

        auto trimmed = util::trimView(chunk);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        auto endpoint = parseProxyUrl(trimmed, config.defaultScheme);
        if (!endpoint) {
            util::log(util::LogLevel::warn, "跳过非法代理条目: " + std::string(trimmed));
            continue;
        }
        applyDefaults(*endpoint, config);
        appendUnique(proxies, seen, std::move(*endpoint));
    }
    return proxies;
}

HttpProxyListSource::HttpProxyListSource(ProxyListConfig config, util::HttpClient& httpClient)
    : config_(std::move(config))
    , httpClient_(httpClient) {}

std::vector<ProxyEndpoint> HttpProxyListSource::fetch() {
    std::vector<util::HttpClient::Header> headers{
        {"Accept", "text/plain, application/json"}
    };

    auto response = httpClient_.fetch("GET", config_.source, headers, "", config_.timeout, true);
    if (response.result() != boost::beast::http::status::ok) {
        throw std::runtime_error("Proxy list source returned status " + std::to_string(response.result_int()));
    }

    const std::string& body = response.body();
    auto proxies = parseProxyList(body, config_);

    auto trimmedBody = util::trimView(std::string_view{body});
    if (proxies.empty() && !trimmedBody.empty()) {
        std::string snippet(trimmedBody.substr(0, std::min<std::size_t>(trimmedBody.size(), 120)));
        throw std::runtime_error("Proxy list payload unexpected: " + snippet);
    }

    util::log(util::LogLevel::info, "代理列表接口获取 " + std::to_string(proxies.size()) + " 个代理");
    return proxies;
}

FileProxyListSource::FileProxyListSource(ProxyListConfig config, std::filesystem::path path)
    : config_(std::move(config))
    , path_(std::move(path)) {}

std::vector<ProxyEndpoint> FileProxyListSource::fetch() {
    std::ifstream ifs(path_);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open proxy list " + path_.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    auto proxies = parseProxyList(content, config_);
    util::log(util::LogLevel::info,
              "从本地文件加载 " + std::to_string(proxies.size()) + " 个代理: " + path_.string());
    return proxies;
}

std::unique_ptr<ProxyListSource> makeProxyListSource(ProxyListConfig config, util::HttpClient& httpClient) {
    const std::string source = config.source;
    if (source.rfind("file://", 0) == 0) {
        return std::make_unique<FileProxyListSource>(std::move(config), source.substr(7));
    }
    if (source.find("://") == std::string::npos) {
        return std::make_unique<FileProxyListSource>(std::move(config), source);
    }
    return std::make_unique<HttpProxyListSource>(std::move(config), httpClient);
}

} // namespace bulkfetch::proxy
