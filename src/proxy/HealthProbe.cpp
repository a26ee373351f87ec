#include "bulkfetch/proxy/HealthProbe.hpp"

#include "bulkfetch/download/Downloader.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace bulkfetch::proxy {
namespace {

std::string scratchName(const ProxyEndpoint& endpoint, std::uint64_t sequence) {
    std::string name = "probe-" + endpoint.host + "-" + std::to_string(endpoint.port);
    std::replace_if(name.begin(), name.end(), [](unsigned char c) {
        return !std::isalnum(c) && c != '-' && c != '.';
    }, '_');
    return name + "-" + std::to_string(sequence);
}

ProbeResult failure(std::string error, std::chrono::milliseconds latency = std::chrono::milliseconds::max()) {
    ProbeResult result;
    result.success = false;
    result.latency = latency;
    result.error = std::move(error);
    return result;
}

} // namespace

std::optional<std::chrono::milliseconds> measureConnectLatency(const ProxyEndpoint& endpoint,
                                                               std::chrono::milliseconds timeout) {
    try {
        boost::asio::io_context io;
        boost::asio::ip::tcp::resolver resolver(io);
        boost::asio::ip::tcp::socket socket(io);
        boost::asio::steady_timer timer(io);
        std::chrono::milliseconds latency = std::chrono::milliseconds::max();
        bool connected = false;

        auto start = std::chrono::steady_clock::now();
        auto endpoints = resolver.resolve(endpoint.host, std::to_string(endpoint.port));

        boost::asio::async_connect(socket, endpoints,
                                   [&](const boost::system::error_code& ec,
                                       const boost::asio::ip::tcp::endpoint&) {
                                       if (!ec) {
                                           connected = true;
                                           latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                               std::chrono::steady_clock::now() - start);
                                       }
                                       timer.cancel();
                                   });

        timer.expires_after(timeout);
        timer.async_wait([&](const boost::system::error_code& ec) {
            if (!ec) {
                socket.cancel();
            }
        });

        io.run();

        if (connected) {
            boost::system::error_code ec;
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
            return latency;
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug, "代理连接测试失败 " + endpoint.key() + ": " + ex.what());
    }
    return std::nullopt;
}

DownloaderHealthProbe::DownloaderHealthProbe(ProbeConfig config, download::Downloader& downloader)
    : config_(std::move(config))
    , downloader_(downloader) {}

ProbeResult DownloaderHealthProbe::probe(const ProxyEndpoint& endpoint) {
    auto latency = measureConnectLatency(endpoint, config_.connectTimeout);
    if (!latency) {
        return failure("connect to " + endpoint.host + ":" + std::to_string(endpoint.port) + " failed");
    }

    const auto scratch = config_.scratchDirectory / scratchName(endpoint, sequence_.fetch_add(1));
    ProbeResult result;
    try {
        std::filesystem::create_directories(scratch);

        model::DownloadTask task;
        task.itemId = config_.referenceItem;
        task.workDirectory = scratch;
        task.constraints.maxResolution = model::Resolution::r360p;
        task.constraints.wantVideo = false;
        task.constraints.wantAudio = false;
        task.timeout = config_.timeout;

        const auto start = std::chrono::steady_clock::now();
        auto fetched = downloader_.fetch(task, endpoint);
        auto elapsed = fetched.artifact.elapsed;
        if (elapsed.count() <= 0) {
            elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        }

        if (fetched.status != model::FetchStatus::success) {
            result = failure(model::describe(fetched.failure), *latency);
        } else if (fetched.artifact.bytes < config_.minBytes) {
            result = failure("transfer too small: " + std::to_string(fetched.artifact.bytes) + " bytes", *latency);
        } else if (config_.maxBytes != 0 && fetched.artifact.bytes > config_.maxBytes) {
            result = failure("transfer size mismatch: " + std::to_string(fetched.artifact.bytes) + " bytes", *latency);
        } else if (elapsed > config_.timeout) {
            result = failure("probe exceeded " + std::to_string(config_.timeout.count()) + "s", *latency);
        } else {
            result.success = true;
            result.latency = *latency;
            result.bytes = fetched.artifact.bytes;
            const auto millis = std::max<std::int64_t>(1, elapsed.count());
            result.throughputBytesPerSec = static_cast<double>(fetched.artifact.bytes) * 1000.0 /
                                           static_cast<double>(millis);
        }
    } catch (const std::exception& ex) {
        result = failure(ex.what(), *latency);
    }

    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);
    return result;
}

} // namespace bulkfetch::proxy
