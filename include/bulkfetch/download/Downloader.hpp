#pragma once

#include "bulkfetch/model/DownloadTask.hpp"
#include "bulkfetch/proxy/ProxyPool.hpp"

namespace bulkfetch::download {

// 实现不得让异常越过 fetch()，所有失败都转换为带类别的 FetchResult。
class Downloader {
public:
    virtual ~Downloader() = default;

    virtual model::FetchResult fetch(const model::DownloadTask& task, const proxy::ProxyEndpoint& proxy) = 0;
};

} // namespace bulkfetch::download
