#include "bulkfetch/proxy/HealthProbe.hpp"

#include "TestSupport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <gtest/gtest.h>

using namespace bulkfetch;

namespace {

// 只监听不 accept，内核完成三次握手即可让连接测试通过。
class LocalListener {
public:
    LocalListener()
        : acceptor_(io_, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {}

    std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

    void close() { acceptor_.close(); }

private:
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

class HealthProbeTest : public ::testing::Test {
protected:
    proxy::ProbeConfig makeConfig() {
        proxy::ProbeConfig config;
        config.referenceItem = "reference";
        config.timeout = std::chrono::seconds{30};
        config.connectTimeout = std::chrono::milliseconds{2000};
        config.minBytes = 1024;
        config.scratchDirectory = dir.path() / "probe";
        return config;
    }

    proxy::ProxyEndpoint local() const { return bulkfetch::testing::endpoint("127.0.0.1", listener.port()); }

    bool scratchIsEmpty() const {
        const auto scratch = dir.path() / "probe";
        return !std::filesystem::exists(scratch) || std::filesystem::is_empty(scratch);
    }

    bulkfetch::testing::TempDir dir;
    LocalListener listener;
    bulkfetch::testing::FakeDownloader downloader;
};

} // namespace

TEST_F(HealthProbeTest, ConnectLatencyIsMeasuredForListeningPort) {
    auto latency = proxy::measureConnectLatency(local(), std::chrono::milliseconds{2000});
    ASSERT_TRUE(latency.has_value());
    EXPECT_LT(*latency, std::chrono::milliseconds{2000});
}

TEST_F(HealthProbeTest, SuccessfulTransferReportsThroughput) {
    downloader.handler = [](const model::DownloadTask& task, const proxy::ProxyEndpoint&, int) {
        return bulkfetch::testing::FakeDownloader::succeed(task, 64 * 1024);
    };
    proxy::DownloaderHealthProbe probe(makeConfig(), downloader);

    auto result = probe.probe(local());
    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.bytes, 64u * 1024u);
    EXPECT_DOUBLE_EQ(result.throughputBytesPerSec, 64.0 * 1024 * 1000);
    EXPECT_LT(result.latency, std::chrono::milliseconds::max());
    EXPECT_TRUE(scratchIsEmpty());
}

TEST_F(HealthProbeTest, ReferenceTaskAsksForSmallestFormat) {
    model::DownloadTask seen;
    downloader.handler = [&seen](const model::DownloadTask& task, const proxy::ProxyEndpoint&, int) {
        seen = task;
        return bulkfetch::testing::FakeDownloader::succeed(task, 4096);
    };
    proxy::DownloaderHealthProbe probe(makeConfig(), downloader);

    ASSERT_TRUE(probe.probe(local()).success);
    EXPECT_EQ(seen.itemId, "reference");
    EXPECT_FALSE(seen.constraints.wantVideo);
    EXPECT_FALSE(seen.constraints.wantAudio);
    EXPECT_EQ(seen.timeout, std::chrono::seconds{30});
    EXPECT_EQ(downloader.calls().front().proxyKey, local().key());
}

TEST_F(HealthProbeTest, UnreachableProxyFailsWithoutDownloading) {
    const auto port = listener.port();
    listener.close();
    proxy::DownloaderHealthProbe probe(makeConfig(), downloader);

    auto result = probe.probe(bulkfetch::testing::endpoint("127.0.0.1", port));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
    EXPECT_EQ(downloader.callCount(), 0u);
}

TEST_F(HealthProbeTest, TooSmallTransferFails) {
    downloader.handler = [](const model::DownloadTask& task, const proxy::ProxyEndpoint&, int) {
        return bulkfetch::testing::FakeDownloader::succeed(task, 100);
    };
    proxy::DownloaderHealthProbe probe(makeConfig(), downloader);

    auto result = probe.probe(local());
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("too small"), std::string::npos);
    EXPECT_TRUE(scratchIsEmpty());
}

TEST_F(HealthProbeTest, TransferAboveExpectedSizeFails) {
    downloader.handler = [](const model::DownloadTask& task, const proxy::ProxyEndpoint&, int) {
        return bulkfetch::testing::FakeDownloader::succeed(task, 8192);
    };
    auto config = makeConfig();
    config.maxBytes = 4096;
    proxy::DownloaderHealthProbe probe(config, downloader);

    EXPECT_FALSE(probe.probe(local()).success);
}

TEST_F(HealthProbeTest, DownloaderFailureIsReported) {
    downloader.handler = [](const model::DownloadTask&, const proxy::ProxyEndpoint&, int) {
        return model::FetchResult::failed(model::FailureKind::proxy_transfer, "Tunnel connection failed");
    };
    proxy::DownloaderHealthProbe probe(makeConfig(), downloader);

    auto result = probe.probe(local());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "proxy_transfer: Tunnel connection failed");
    EXPECT_LT(result.latency, std::chrono::milliseconds::max());
}

TEST_F(HealthProbeTest, DownloaderExceptionDoesNotEscape) {
    downloader.handler = [](const model::DownloadTask&, const proxy::ProxyEndpoint&, int) -> model::FetchResult {
        throw std::runtime_error("disk full");
    };
    proxy::DownloaderHealthProbe probe(makeConfig(), downloader);

    proxy::ProbeResult result;
    EXPECT_NO_THROW(result = probe.probe(local()));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "disk full");
}
