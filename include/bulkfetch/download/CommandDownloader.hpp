#pragma once

#include "bulkfetch/download/Downloader.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace bulkfetch::download {

struct CommandDownloaderConfig {
    std::string command{"yt-dlp"};
    std::string urlTemplate{"https://www.youtube.com/watch?v={id}"};
    std::chrono::seconds timeout{std::chrono::seconds{600}};
    std::vector<std::string> extraArgs;
};

// 调用 yt-dlp 兼容的外部命令，通过 --proxy 走代理，按退出码和输出关键字归类失败。
class CommandDownloader : public Downloader {
public:
    explicit CommandDownloader(CommandDownloaderConfig config);

    model::FetchResult fetch(const model::DownloadTask& task, const proxy::ProxyEndpoint& proxy) override;

    std::string buildCommand(const model::DownloadTask& task,
                             const proxy::ProxyEndpoint& proxy,
                             const std::string& outputTemplate) const;

    static std::string formatSelector(const model::DownloadConstraints& constraints);
    static model::FailureKind classifyOutput(std::string_view output);

private:
    CommandDownloaderConfig config_;
};

} // namespace bulkfetch::download
