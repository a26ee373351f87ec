#include "bulkfetch/util/HttpClient.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace bulkfetch::util {
namespace {
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using Deadline = std::chrono::steady_clock::time_point;

constexpr unsigned kHttpVersion = 11;
constexpr std::uint64_t kStringBodyLimit = 64ULL * 1024 * 1024;
constexpr char kUserAgent[] =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find_first_of("/?", hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
}

bool isRedirect(http::status status) {
    switch (status) {
    case http::status::moved_permanently:
    case http::status::found:
    case http::status::see_other:
    case http::status::temporary_redirect:
    case http::status::permanent_redirect:
        return true;
    default:
        return false;
    }
}

std::string combineLocation(const ParsedUrl& base, const std::string& location) {
    if (location.empty()) {
        return base.scheme + "://" + base.host + base.target;
    }
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    std::string prefix = base.scheme + "://" + base.host;
    if (!base.port.empty() && base.port != "80" && base.port != "443") {
        prefix += ":" + base.port;
    }
    if (location.front() == '/') {
        return prefix + location;
    }
    auto slashPos = base.target.find_last_of('/');
    std::string basePath = slashPos == std::string::npos ? "/" : base.target.substr(0, slashPos + 1);
    return prefix + basePath + location;
}

http::verb toVerb(const std::string& method) {
    std::string upper;
    upper.reserve(method.size());
    std::transform(method.begin(), method.end(), std::back_inserter(upper), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "GET") return http::verb::get;
    if (upper == "POST") return http::verb::post;
    if (upper == "PUT") return http::verb::put;
    if (upper == "DELETE") return http::verb::delete_;
    if (upper == "HEAD") return http::verb::head;
    throw std::invalid_argument("Unsupported HTTP method: " + method);
}

std::string base64Encode(std::string_view input) {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::uint32_t value = 0;
    int bitCount = -6;
    for (unsigned char c : input) {
        value = (value << 8) | c;
        bitCount += 8;
        while (bitCount >= 0) {
            output.push_back(alphabet[(value >> bitCount) & 0x3F]);
            bitCount -= 6;
        }
    }

    if (bitCount > -6) {
        output.push_back(alphabet[((value << 8) >> (bitCount + 8)) & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

std::string proxyAuthorization(const proxy::ProxyEndpoint& proxy) {
    if (proxy.username.empty() && proxy.password.empty()) {
        return {};
    }
    std::string credentials = proxy.username + ":" + proxy.password;
    return "Basic " + base64Encode(credentials);
}

std::string authorityFrom(const ParsedUrl& parsed) {
    if ((parsed.scheme == "http" && parsed.port == "80") ||
        (parsed.scheme == "https" && parsed.port == "443")) {
        return parsed.host;
    }
    return parsed.host + ":" + parsed.port;
}

void ensureSupportedProxy(const proxy::ProxyEndpoint& proxy) {
    if (proxy.scheme != "http" && proxy.scheme != "https") {
        throw ProxyError(ProxyError::Type::unsupported_scheme, 0,
                         "HTTP client cannot tunnel through " + proxy.scheme + " proxy " + proxy.host);
    }
}

// 在本地 io_context 上驱动单个异步操作直至完成，超时由 tcp_stream 的定时器取消。
template <typename Initiation>
void runOperation(boost::asio::io_context& io, Initiation&& initiation) {
    boost::system::error_code result = boost::asio::error::would_block;
    initiation([&result](boost::system::error_code ec, auto&&...) { result = ec; });
    io.restart();
    io.run();
    if (result) {
        throw boost::system::system_error(result);
    }
}

void connectStream(boost::asio::io_context& io,
                   boost::beast::tcp_stream& stream,
                   const std::string& host,
                   const std::string& port,
                   Deadline deadline,
                   bool viaProxy) {
    tcp::resolver resolver(io);
    boost::system::error_code ec;
    auto results = resolver.resolve(host, port, ec);
    if (ec) {
        if (viaProxy) {
            throw ProxyError(ProxyError::Type::connect_failed, 0,
                             "Resolve proxy " + host + " failed: " + ec.message());
        }
        throw boost::system::system_error(ec);
    }

    stream.expires_at(deadline);
    try {
        runOperation(io, [&](auto handler) { stream.async_connect(results, std::move(handler)); });
    } catch (const boost::system::system_error& err) {
        if (viaProxy && err.code() != boost::beast::error::timeout) {
            throw ProxyError(ProxyError::Type::connect_failed, 0,
                             "Connect proxy " + host + ":" + port + " failed: " + err.code().message());
        }
        throw;
    }
}

void openTunnel(boost::asio::io_context& io,
                boost::beast::tcp_stream& stream,
                const ParsedUrl& parsed,
                const proxy::ProxyEndpoint& proxy,
                Deadline deadline) {
    const std::string authority = parsed.host + ":" + parsed.port;
    http::request<http::empty_body> connectRequest{http::verb::connect, authority, kHttpVersion};
    connectRequest.set(http::field::host, authority);
    if (auto auth = proxyAuthorization(proxy); !auth.empty()) {
        connectRequest.set(http::field::proxy_authorization, auth);
    }

    stream.expires_at(deadline);
    runOperation(io, [&](auto handler) { http::async_write(stream, connectRequest, std::move(handler)); });

    boost::beast::flat_buffer connectBuffer;
    http::response_parser<http::empty_body> connectParser;
    connectParser.skip(true);
    runOperation(io, [&](auto handler) {
        http::async_read_header(stream, connectBuffer, connectParser, std::move(handler));
    });

    const auto status = connectParser.get().result();
    if (status == http::status::proxy_authentication_required) {
        throw ProxyError(ProxyError::Type::authentication_required, 407, "Proxy authentication required");
    }
    if (status != http::status::ok) {
        throw ProxyError(ProxyError::Type::connect_failed, static_cast<int>(status),
                         "Proxy CONNECT failed with status " + std::to_string(static_cast<int>(status)));
    }
}

template <typename Stream, typename Parser>
void exchange(boost::asio::io_context& io,
              Stream& stream,
              boost::beast::tcp_stream& lowest,
              HttpClient::HttpRequest& request,
              Parser& parser,
              Deadline deadline) {
    lowest.expires_at(deadline);
    runOperation(io, [&](auto handler) { http::async_write(stream, request, std::move(handler)); });
    boost::beast::flat_buffer buffer;
    lowest.expires_at(deadline);
    runOperation(io, [&](auto handler) { http::async_read(stream, buffer, parser, std::move(handler)); });
}

template <typename Parser>
void performExchange(boost::asio::ssl::context& sslContext,
                     const ParsedUrl& parsed,
                     HttpClient::HttpRequest request,
                     Parser& parser,
                     std::chrono::seconds timeout,
                     const proxy::ProxyEndpoint* proxy) {
    if (proxy) {
        ensureSupportedProxy(*proxy);
    }
    boost::asio::io_context io;
    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    const std::string connectHost = proxy ? proxy->host : parsed.host;
    const std::string connectPort = proxy ? std::to_string(proxy->port) : parsed.port;

    request.version(kHttpVersion);
    request.set(http::field::host, authorityFrom(parsed));
    if (request.count(http::field::user_agent) == 0) {
        request.set(http::field::user_agent, kUserAgent);
    }

    if (parsed.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io, sslContext);
        auto& lowest = boost::beast::get_lowest_layer(stream);
        connectStream(io, lowest, connectHost, connectPort, deadline, proxy != nullptr);
        if (proxy) {
            openTunnel(io, lowest, parsed, *proxy, deadline);
        }

        if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name");
        }
        lowest.expires_at(deadline);
        runOperation(io, [&](auto handler) {
            stream.async_handshake(boost::asio::ssl::stream_base::client, std::move(handler));
        });

        exchange(io, stream, lowest, request, parser, deadline);

        boost::system::error_code ec;
        lowest.expires_after(std::chrono::seconds{2});
        stream.async_shutdown([&ec](boost::system::error_code shutdownEc) { ec = shutdownEc; });
        io.restart();
        io.run();
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated) {
            log(LogLevel::debug, "TLS shutdown: " + ec.message());
        }
        return;
    }

    boost::beast::tcp_stream stream(io);
    connectStream(io, stream, connectHost, connectPort, deadline, proxy != nullptr);
    if (proxy) {
        request.target(parsed.scheme + "://" + authorityFrom(parsed) + parsed.target);
        if (auto auth = proxyAuthorization(*proxy); !auth.empty()) {
            request.set(http::field::proxy_authorization, auth);
        }
    }

    exchange(io, stream, stream, request, parser, deadline);

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    if (proxy && parser.get().result() == http::status::proxy_authentication_required) {
        throw ProxyError(ProxyError::Type::authentication_required, 407, "Proxy authentication required");
    }
}

} // namespace

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_none);
}

HttpClient::HttpResponse HttpClient::fetch(HttpRequest request,
                                           const std::string& scheme,
                                           std::chrono::seconds timeout,
                                           const proxy::ProxyEndpoint* proxy) {
    if (request.count(http::field::host) == 0) {
        throw std::runtime_error("request missing Host header");
    }

    ParsedUrl parsed;
    parsed.scheme = scheme.empty() ? std::string{"http"} : scheme;
    parsed.host = std::string(request[http::field::host]);
    parsed.port = (parsed.scheme == "https") ? "443" : "80";
    auto colon = parsed.host.find(':');
    if (colon != std::string::npos) {
        parsed.port = parsed.host.substr(colon + 1);
        parsed.host = parsed.host.substr(0, colon);
    }
    parsed.target = std::string(request.target());
    if (parsed.target.empty()) {
        parsed.target = "/";
        request.target(parsed.target);
    }

    http::response_parser<http::string_body> parser;
    parser.body_limit(kStringBodyLimit);
    performExchange(sslContext_, parsed, std::move(request), parser, timeout, proxy);
    return parser.release();
}

HttpClient::HttpResponse HttpClient::fetch(const std::string& method,
                                           const std::string& url,
                                           const std::vector<Header>& headers,
                                           const std::string& body,
                                           std::chrono::seconds timeout,
                                           bool followRedirects,
                                           unsigned int maxRedirects,
                                           std::string* effectiveUrl,
                                           const proxy::ProxyEndpoint* proxy) {
    std::string currentUrl = url;
    std::string currentMethod = method;
    std::string currentBody = body;
    HttpResponse response;

    for (unsigned int redirect = 0; redirect <= maxRedirects; ++redirect) {
        ParsedUrl parsed = parseUrl(currentUrl);
        HttpRequest request{toVerb(currentMethod), parsed.target, kHttpVersion};
        request.set(http::field::host, authorityFrom(parsed));

        for (const auto& header : headers) {
            request.set(header.name, header.value);
        }

        if (!currentBody.empty() && request.method() != http::verb::get && request.method() != http::verb::head) {
            request.body() = currentBody;
            request.prepare_payload();
        }

        response = fetch(std::move(request), parsed.scheme, timeout, proxy);

        if (effectiveUrl) {
            *effectiveUrl = currentUrl;
        }

        if (!followRedirects || !isRedirect(response.result())) {
            return response;
        }

        auto locationIt = response.base().find(http::field::location);
        if (locationIt == response.base().end()) {
            return response;
        }

        currentUrl = combineLocation(parsed, std::string(locationIt->value()));

        if (response.result() == http::status::see_other && currentMethod != "GET" && currentMethod != "HEAD") {
            currentMethod = "GET";
            currentBody.clear();
        }
    }

    throw std::runtime_error("Maximum redirect count exceeded");
}

HttpClient::FileResult HttpClient::download(const std::string& url,
                                            const std::vector<Header>& headers,
                                            const std::filesystem::path& target,
                                            std::chrono::seconds timeout,
                                            const proxy::ProxyEndpoint* proxy,
                                            std::uint64_t bodyLimit,
                                            unsigned int maxRedirects) {
    std::string currentUrl = url;

    for (unsigned int redirect = 0; redirect <= maxRedirects; ++redirect) {
        ParsedUrl parsed = parseUrl(currentUrl);
        HttpRequest request{http::verb::get, parsed.target, kHttpVersion};
        for (const auto& header : headers) {
            request.set(header.name, header.value);
        }

        http::response_parser<http::file_body> parser;
        parser.body_limit(bodyLimit == 0 ? std::numeric_limits<std::uint64_t>::max() : bodyLimit);
        boost::beast::error_code ec;
        parser.get().body().open(target.string().c_str(), boost::beast::file_mode::write, ec);
        if (ec) {
            throw boost::system::system_error(ec);
        }

        try {
            performExchange(sslContext_, parsed, std::move(request), parser, timeout, proxy);
        } catch (...) {
            parser.get().body().close();
            std::error_code removeEc;
            std::filesystem::remove(target, removeEc);
            throw;
        }
        parser.get().body().close();

        const auto& response = parser.get();
        FileResult result;
        result.status = response.result_int();
        result.effectiveUrl = currentUrl;
        if (auto it = response.base().find(http::field::content_type); it != response.base().end()) {
            result.contentType = std::string(it->value());
        }

        if (isRedirect(response.result())) {
            auto locationIt = response.base().find(http::field::location);
            std::error_code removeEc;
            std::filesystem::remove(target, removeEc);
            if (locationIt == response.base().end()) {
                return result;
            }
            currentUrl = combineLocation(parsed, std::string(locationIt->value()));
            continue;
        }

        if (result.status < 200 || result.status >= 300) {
            std::error_code removeEc;
            std::filesystem::remove(target, removeEc);
            return result;
        }

        result.bytes = std::filesystem::file_size(target);
        return result;
    }

    throw std::runtime_error("Maximum redirect count exceeded");
}

} // namespace bulkfetch::util
