#pragma once

#include "bulkfetch/model/Resolution.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace bulkfetch::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class DownloaderKind {
    command,
    http
};

struct AppConfig {
    unsigned int maxConcurrent{5};
    int maxRetries{3};
    int errorThreshold{10};
    // 0 表示 max(1, maxConcurrent / 2)。
    unsigned int perProxyLimit{0};

    std::string proxyListUrl;
    std::string proxyScheme{"http"};
    std::string proxyUsername;
    std::string proxyPassword;
    double proxyMinSpeed{1.0}; // MB/s
    int deadThreshold{3};
    std::chrono::minutes refreshInterval{std::chrono::minutes{10}};
    unsigned int probeConcurrency{8};

    std::string probeItem;
    std::chrono::seconds probeTimeout{std::chrono::seconds{60}};
    std::uint64_t probeMinBytes{1024};
    std::uint64_t probeMaxBytes{0};

    DownloaderKind downloader{DownloaderKind::command};
    std::string downloaderCommand{"yt-dlp"};
    std::string urlTemplate{"https://www.youtube.com/watch?v={id}"};
    std::chrono::seconds downloadTimeout{std::chrono::seconds{600}};
    model::Resolution defaultResolution{model::Resolution::r1080p};
    bool wantVideo{true};
    bool wantAudio{true};
    std::string idPattern{"^[A-Za-z0-9_-]{11}$"};

    std::filesystem::path workDir{"."};
    std::filesystem::path outputDir;
    std::string logLevel{"info"};
    std::filesystem::path logFile;

    std::filesystem::path idFile;
    std::string idColumn;

    // bucket 为空时输出到本地 outputDir，否则上传到 S3 兼容存储。
    std::string bucket;
    std::string s3Endpoint;
    std::string s3Region{"us-east-1"};
    bool s3PathStyle{false};
    std::string storagePrefix{"downloads"};
    std::string s3AccessKeyId;
    std::string s3SecretAccessKey;
    std::string s3SessionToken;

    unsigned int effectivePerProxyLimit() const;
    std::filesystem::path effectiveOutputDir() const;
    std::filesystem::path cacheDir() const { return workDir / "cache"; }
    std::filesystem::path downloadsDir() const { return workDir / "downloads"; }
    double minThroughputBytesPerSec() const { return proxyMinSpeed * 1024.0 * 1024.0; }

    void validate() const;
};

struct CommandLineOptions {
    std::filesystem::path idFile;
    std::string idColumn;
    std::optional<std::filesystem::path> configFile;
    std::optional<std::filesystem::path> workDir;
    std::optional<std::filesystem::path> outputDir;
    std::optional<model::Resolution> maxResolution;
    std::optional<unsigned int> maxConcurrent;
    std::optional<int> maxRetries;
    std::optional<std::string> bucket;
    bool noVideo{};
    bool noAudio{};
    bool help{};
};

// args 不含程序名，参数非法时抛出 ConfigError。
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

void applyJson(AppConfig& config, const boost::json::object& json);
void applyEnvironment(AppConfig& config);
void applyCommandLine(AppConfig& config, const CommandLineOptions& options);

// 默认值 -> JSON 配置文件 -> BULKFETCH_* 环境变量 -> 命令行，最后 validate()。
AppConfig loadAppConfig(const CommandLineOptions& options);

std::string usage(std::string_view program);

} // namespace bulkfetch::config
