#include "bulkfetch/config/AppConfig.hpp"
#include "bulkfetch/download/CommandDownloader.hpp"
#include "bulkfetch/download/HttpDownloader.hpp"
#include "bulkfetch/input/IdListReader.hpp"
#include "bulkfetch/proxy/HealthProbe.hpp"
#include "bulkfetch/proxy/ProxyListClient.hpp"
#include "bulkfetch/repository/ResumableStateStore.hpp"
#include "bulkfetch/service/ProxySupervisor.hpp"
#include "bulkfetch/storage/ObjectStoreSink.hpp"
#include "bulkfetch/storage/S3Client.hpp"
#include "bulkfetch/storage/StorageSink.hpp"
#include "bulkfetch/util/HttpClient.hpp"
#include "bulkfetch/util/Logging.hpp"
#include "bulkfetch/workflow/DownloadOrchestrator.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitStartup = 1;
constexpr int kExitBreaker = 2;
constexpr int kExitInterrupted = 130;

using namespace bulkfetch;

// 后台 io 线程，析构时停止 io_context 并等待线程退出。
class IoThread {
public:
    explicit IoThread(boost::asio::io_context& io)
        : io_(io)
        , thread_([&io]() { io.run(); }) {}

    ~IoThread() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    IoThread(const IoThread&) = delete;
    IoThread& operator=(const IoThread&) = delete;

private:
    boost::asio::io_context& io_;
    std::thread thread_;
};

std::unique_ptr<download::Downloader> makeDownloader(const config::AppConfig& appConfig,
                                                     util::HttpClient& httpClient) {
    if (appConfig.downloader == config::DownloaderKind::http) {
        download::HttpDownloaderConfig httpConfig;
        httpConfig.urlTemplate = appConfig.urlTemplate;
        httpConfig.timeout = appConfig.downloadTimeout;
        return std::make_unique<download::HttpDownloader>(std::move(httpConfig), httpClient);
    }
    download::CommandDownloaderConfig commandConfig;
    commandConfig.command = appConfig.downloaderCommand;
    commandConfig.urlTemplate = appConfig.urlTemplate;
    commandConfig.timeout = appConfig.downloadTimeout;
    return std::make_unique<download::CommandDownloader>(std::move(commandConfig));
}

storage::S3Config makeS3Config(const config::AppConfig& appConfig) {
    storage::S3Config s3Config;
    s3Config.endpoint = appConfig.s3Endpoint;
    s3Config.region = appConfig.s3Region;
    s3Config.bucket = appConfig.bucket;
    s3Config.accessKeyId = appConfig.s3AccessKeyId;
    s3Config.secretAccessKey = appConfig.s3SecretAccessKey;
    s3Config.sessionToken = appConfig.s3SessionToken;
    s3Config.pathStyle = appConfig.s3PathStyle;
    return s3Config;
}

int runApplication(const config::AppConfig& appConfig) {
    // 需先于持有定时器的 ProxySupervisor 构造、后于其析构。
    boost::asio::io_context io;

    auto ids = input::readItemIds(appConfig.idFile, appConfig.idColumn);

    std::filesystem::create_directories(appConfig.cacheDir());
    std::filesystem::create_directories(appConfig.downloadsDir());
    if (appConfig.bucket.empty()) {
        std::filesystem::create_directories(appConfig.effectiveOutputDir());
    }

    util::HttpClient httpClient;

    proxy::ProxyListConfig listConfig;
    listConfig.source = appConfig.proxyListUrl;
    listConfig.defaultScheme = appConfig.proxyScheme;
    listConfig.username = appConfig.proxyUsername;
    listConfig.password = appConfig.proxyPassword;
    auto listSource = proxy::makeProxyListSource(std::move(listConfig), httpClient);

    auto downloader = makeDownloader(appConfig, httpClient);

    proxy::ProbeConfig probeConfig;
    probeConfig.referenceItem = appConfig.probeItem;
    probeConfig.timeout = appConfig.probeTimeout;
    probeConfig.minBytes = appConfig.probeMinBytes;
    probeConfig.maxBytes = appConfig.probeMaxBytes;
    probeConfig.scratchDirectory = appConfig.downloadsDir() / ".probe";
    proxy::DownloaderHealthProbe probe(std::move(probeConfig), *downloader);

    service::SupervisorConfig supervisorConfig;
    supervisorConfig.policy.minThroughput = appConfig.minThroughputBytesPerSec();
    supervisorConfig.policy.deadThreshold = appConfig.deadThreshold;
    supervisorConfig.policy.perProxyLimit = appConfig.effectivePerProxyLimit();
    supervisorConfig.probeConcurrency = appConfig.probeConcurrency;
    supervisorConfig.refreshInterval = appConfig.refreshInterval;
    supervisorConfig.snapshotPath = appConfig.cacheDir() / "proxies.json";
    supervisorConfig.proxyUsername = appConfig.proxyUsername;
    supervisorConfig.proxyPassword = appConfig.proxyPassword;
    service::ProxySupervisor supervisor(std::move(supervisorConfig), *listSource, probe);

    repository::ResumableStateStore store(appConfig.cacheDir() / "state.jsonl");
    store.open();

    std::unique_ptr<storage::S3Client> s3Client;
    std::unique_ptr<storage::StorageSink> sink;
    if (appConfig.bucket.empty()) {
        sink = std::make_unique<storage::LocalDirectorySink>(appConfig.effectiveOutputDir());
    } else {
        s3Client = std::make_unique<storage::S3Client>(makeS3Config(appConfig), httpClient);
        sink = std::make_unique<storage::ObjectStoreSink>(*s3Client, appConfig.storagePrefix);
        util::log(util::LogLevel::info, "输出到 S3 存储桶 " + appConfig.bucket);
    }

    workflow::OrchestratorConfig orchestratorConfig;
    orchestratorConfig.maxConcurrent = appConfig.maxConcurrent;
    orchestratorConfig.maxRetries = appConfig.maxRetries;
    orchestratorConfig.errorThreshold = appConfig.errorThreshold;
    orchestratorConfig.workDirectory = appConfig.downloadsDir();
    orchestratorConfig.constraints.maxResolution = appConfig.defaultResolution;
    orchestratorConfig.constraints.wantVideo = appConfig.wantVideo;
    orchestratorConfig.constraints.wantAudio = appConfig.wantAudio;
    orchestratorConfig.downloadTimeout = appConfig.downloadTimeout;
    orchestratorConfig.idPattern = appConfig.idPattern;
    workflow::DownloadOrchestrator orchestrator(std::move(orchestratorConfig), supervisor, *downloader, *sink,
                                                store);

    std::atomic<bool> interrupted{false};
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signalNumber) {
        if (!ec) {
            util::log(util::LogLevel::warn, "收到信号 " + std::to_string(signalNumber) + "，正在停止");
            interrupted = true;
            supervisor.interrupt();
            orchestrator.cancel();
        }
    });
    auto work = boost::asio::make_work_guard(io);

    workflow::RunSummary summary;
    {
        IoThread ioThread(io);

        supervisor.loadSnapshot();
        supervisor.refresh();
        supervisor.probeAll();
        if (!interrupted) {
            util::log(util::LogLevel::info, "可用代理 " + std::to_string(supervisor.usableCount()) + " 个");
            supervisor.start(io);
            summary = orchestrator.run(ids);
            supervisor.stop();
        }
    }
    supervisor.saveSnapshot();

    util::log(util::LogLevel::info,
              "汇总: 总数 " + std::to_string(summary.total) + " 跳过 " + std::to_string(summary.skipped) +
                  " 完成 " + std::to_string(summary.completed) + " 失败 " + std::to_string(summary.failed) +
                  " 未处理 " + std::to_string(summary.pending) + " 等待代理超时 " + std::to_string(summary.deferred));

    if (summary.journalFailed) {
        util::log(util::LogLevel::error, "状态日志写入失败，本次运行结果不完整");
        return kExitStartup;
    }

    if (interrupted || summary.cancelled) {
        return kExitInterrupted;
    }
    if (summary.breakerTripped) {
        return kExitBreaker;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    util::initLogging(util::LogLevel::info);

    std::vector<std::string> args(argv + 1, argv + argc);
    config::AppConfig appConfig;
    try {
        auto options = config::parseCommandLine(args);
        if (options.help) {
            std::cout << config::usage(argv[0]);
            return kExitOk;
        }
        appConfig = config::loadAppConfig(options);
    } catch (const config::ConfigError& ex) {
        std::cerr << "配置错误: " << ex.what() << "\n" << config::usage(argv[0]);
        return kExitStartup;
    }

    util::initLogging(util::parseLogLevel(appConfig.logLevel));
    if (!appConfig.logFile.empty()) {
        util::setLogFile(appConfig.logFile);
    }

    try {
        return runApplication(appConfig);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"启动失败: "} + ex.what());
        return kExitStartup;
    }
}
