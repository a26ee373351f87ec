#pragma once

#include "bulkfetch/download/Downloader.hpp"
#include "bulkfetch/util/HttpClient.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace bulkfetch::download {

struct HttpDownloaderConfig {
    // {id} 会被替换为条目 ID。
    std::string urlTemplate;
    std::chrono::seconds timeout{std::chrono::seconds{600}};
    std::uint64_t bodyLimit{0};
    std::vector<util::HttpClient::Header> headers;
};

class HttpDownloader : public Downloader {
public:
    HttpDownloader(HttpDownloaderConfig config, util::HttpClient& httpClient);

    model::FetchResult fetch(const model::DownloadTask& task, const proxy::ProxyEndpoint& proxy) override;

    static model::FailureKind classifyStatus(unsigned int status);

private:
    HttpDownloaderConfig config_;
    util::HttpClient& httpClient_;
};

} // namespace bulkfetch::download
