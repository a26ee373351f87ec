#pragma once

#include "bulkfetch/proxy/ProxyPool.hpp"

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace bulkfetch::util {

class ProxyError : public std::runtime_error {
public:
    enum class Type {
        connect_failed,
        authentication_required,
        unsupported_scheme,
    };

    ProxyError(Type type, int status, const std::string& message)
        : std::runtime_error(message)
        , type_(type)
        , status_(status) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

    [[nodiscard]] int status() const noexcept { return status_; }

private:
    Type type_;
    int status_;
};

// 每次调用使用独立的 io_context，超时由 beast::tcp_stream 的定时器保证，可被多个线程同时使用。
class HttpClient {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    struct Header {
        std::string name;
        std::string value;
    };

    struct FileResult {
        unsigned int status{};
        std::uintmax_t bytes{};
        std::string contentType;
        std::string effectiveUrl;
    };

    HttpClient();

    HttpResponse fetch(HttpRequest request,
                       const std::string& scheme,
                       std::chrono::seconds timeout,
                       const proxy::ProxyEndpoint* proxy = nullptr);

    HttpResponse fetch(const std::string& method,
                       const std::string& url,
                       const std::vector<Header>& headers,
                       const std::string& body,
                       std::chrono::seconds timeout,
                       bool followRedirects = false,
                       unsigned int maxRedirects = 5,
                       std::string* effectiveUrl = nullptr,
                       const proxy::ProxyEndpoint* proxy = nullptr);

    // 响应体直接写入 target；非 2xx 时删除文件并仅返回状态码。
    FileResult download(const std::string& url,
                        const std::vector<Header>& headers,
                        const std::filesystem::path& target,
                        std::chrono::seconds timeout,
                        const proxy::ProxyEndpoint* proxy = nullptr,
                        std::uint64_t bodyLimit = 0,
                        unsigned int maxRedirects = 5);

private:
    boost::asio::ssl::context sslContext_;
};

} // namespace bulkfetch::util
