#include "bulkfetch/download/HttpDownloader.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace bulkfetch::download {
namespace {

std::string extensionFromUrl(const std::string& url) {
    auto path = url.substr(0, url.find_first_of("?#"));
    auto slash = path.find_last_of('/');
    auto name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == name.size() || name.size() - dot > 6) {
        return ".bin";
    }
    return name.substr(dot);
}

bool isTimeout(const boost::system::error_code& ec) {
    return ec == boost::beast::error::timeout || ec == boost::asio::error::timed_out;
}

} // namespace

HttpDownloader::HttpDownloader(HttpDownloaderConfig config, util::HttpClient& httpClient)
    : config_(std::move(config))
    , httpClient_(httpClient) {}

model::FailureKind HttpDownloader::classifyStatus(unsigned int status) {
    switch (status) {
    case 404:
    case 410:
        return model::FailureKind::item_not_found;
    case 401:
    case 403:
    case 451:
        return model::FailureKind::item_restricted;
    case 408:
    case 504:
        return model::FailureKind::network_timeout;
    default:
        return model::FailureKind::proxy_transfer;
    }
}

model::FetchResult HttpDownloader::fetch(const model::DownloadTask& task, const proxy::ProxyEndpoint& proxy) {
    if (!model::isSafeItemId(task.itemId)) {
        return model::FetchResult::failed(model::FailureKind::malformed_id, "id is not usable as a file name");
    }
    const auto url = util::replaceAll(config_.urlTemplate, "{id}", task.itemId);
    const auto directory = task.workDirectory / task.itemId;
    const auto target = directory / (task.itemId + extensionFromUrl(url));
    const auto timeout = task.timeout.count() > 0 ? task.timeout : config_.timeout;
    const auto start = std::chrono::steady_clock::now();

    try {
        std::filesystem::create_directories(directory);
        auto response = httpClient_.download(url, config_.headers, target, timeout, &proxy, config_.bodyLimit);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (response.status < 200 || response.status >= 300) {
            return model::FetchResult::failed(classifyStatus(response.status),
                                              "HTTP " + std::to_string(response.status) + " for " + url);
        }
        if (response.bytes == 0) {
            std::error_code ec;
            std::filesystem::remove(target, ec);
            return model::FetchResult::failed(model::FailureKind::proxy_transfer, "empty body for " + url);
        }

        model::Artifact artifact;
        artifact.files.push_back(target);
        artifact.bytes = response.bytes;
        artifact.elapsed = elapsed;
        artifact.metadata["id"] = task.itemId;
        artifact.metadata["url"] = response.effectiveUrl;
        artifact.metadata["contentType"] = response.contentType;
        artifact.metadata["bytes"] = static_cast<std::uint64_t>(response.bytes);
        return model::FetchResult::ok(std::move(artifact));
    } catch (const util::ProxyError& ex) {
        return model::FetchResult::failed(model::FailureKind::proxy_transfer, ex.what());
    } catch (const boost::system::system_error& ex) {
        if (isTimeout(ex.code())) {
            return model::FetchResult::failed(model::FailureKind::network_timeout, ex.what());
        }
        if (ex.code() == boost::beast::http::error::body_limit) {
            return model::FetchResult::failed(model::FailureKind::item_restricted, "body exceeds size limit");
        }
        return model::FetchResult::failed(model::FailureKind::proxy_transfer, ex.what());
    } catch (const std::invalid_argument& ex) {
        return model::FetchResult::failed(model::FailureKind::malformed_id, ex.what());
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "下载异常 id=" + task.itemId + " error=" + ex.what());
        return model::FetchResult::failed(model::FailureKind::internal, ex.what());
    }
}

} // namespace bulkfetch::download
