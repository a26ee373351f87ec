#include "bulkfetch/config/AppConfig.hpp"

#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <unistd.h>

extern char** environ;

using namespace bulkfetch;

namespace {

std::vector<std::pair<std::string, std::string>> takeBulkfetchEnvironment() {
    std::vector<std::pair<std::string, std::string>> saved;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view text(*entry);
        if (text.rfind("BULKFETCH_", 0) != 0 && text.rfind("AWS_", 0) != 0) {
            continue;
        }
        const auto eq = text.find('=');
        saved.emplace_back(std::string(text.substr(0, eq)),
                           eq == std::string_view::npos ? std::string{} : std::string(text.substr(eq + 1)));
    }
    for (const auto& [name, value] : saved) {
        ::unsetenv(name.c_str());
    }
    return saved;
}

// 测试期间屏蔽外部 BULKFETCH_* 与 AWS_* 变量，结束时恢复。
class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = takeBulkfetchEnvironment(); }

    void TearDown() override {
        takeBulkfetchEnvironment();
        for (const auto& [name, value] : saved_) {
            ::setenv(name.c_str(), value.c_str(), 1);
        }
    }

    static void setEnv(const char* name, const char* value) { ::setenv(name, value, 1); }

    static config::CommandLineOptions options(std::vector<std::string> args) {
        return config::parseCommandLine(args);
    }

    bulkfetch::testing::TempDir dir;

private:
    std::vector<std::pair<std::string, std::string>> saved_;
};

} // namespace

TEST_F(AppConfigTest, ParsesPositionalArgumentsAndFlags) {
    auto parsed = options({"ids.csv", "video_id", "--max-resolution", "720p", "--no-audio", "--max-concurrent", "8",
                           "--max-retries", "2", "--work-dir", "/data", "--output-dir", "/out"});
    EXPECT_EQ(parsed.idFile, "ids.csv");
    EXPECT_EQ(parsed.idColumn, "video_id");
    EXPECT_EQ(parsed.maxResolution, model::Resolution::r720p);
    EXPECT_TRUE(parsed.noAudio);
    EXPECT_FALSE(parsed.noVideo);
    EXPECT_EQ(parsed.maxConcurrent, 8u);
    EXPECT_EQ(parsed.maxRetries, 2);
    EXPECT_EQ(parsed.workDir, std::filesystem::path{"/data"});
    EXPECT_EQ(parsed.outputDir, std::filesystem::path{"/out"});
}

TEST_F(AppConfigTest, RejectsInvalidCommandLines) {
    EXPECT_THROW(options({}), config::ConfigError);
    EXPECT_THROW(options({"ids.txt", "--bogus"}), config::ConfigError);
    EXPECT_THROW(options({"ids.txt", "--max-concurrent"}), config::ConfigError);
    EXPECT_THROW(options({"ids.txt", "--max-concurrent", "many"}), config::ConfigError);
    EXPECT_THROW(options({"ids.txt", "--max-retries", "-1"}), config::ConfigError);
    EXPECT_THROW(options({"ids.txt", "--max-resolution", "8K"}), config::ConfigError);
    EXPECT_THROW(options({"ids.txt", "col", "extra"}), config::ConfigError);
    EXPECT_THROW(options({"ids.txt", "--no-video", "--no-audio"}), config::ConfigError);
}

TEST_F(AppConfigTest, HelpNeedsNoOtherArguments) {
    auto parsed = options({"--help"});
    EXPECT_TRUE(parsed.help);
    EXPECT_NE(config::usage("bulkfetch").find("--max-resolution"), std::string::npos);
}

TEST_F(AppConfigTest, RequiresProxyListAndProbeItem) {
    EXPECT_THROW(config::loadAppConfig(options({"ids.txt"})), config::ConfigError);

    setEnv("BULKFETCH_PROXY_LIST_URL", "https://proxies.example/list");
    EXPECT_THROW(config::loadAppConfig(options({"ids.txt"})), config::ConfigError);

    setEnv("BULKFETCH_TEST_ITEM", "dQw4w9WgXcQ");
    auto loaded = config::loadAppConfig(options({"ids.txt"}));
    EXPECT_EQ(loaded.proxyListUrl, "https://proxies.example/list");
    EXPECT_EQ(loaded.probeItem, "dQw4w9WgXcQ");
    EXPECT_EQ(loaded.idFile, "ids.txt");
    EXPECT_EQ(loaded.maxConcurrent, 5u);
    EXPECT_EQ(loaded.maxRetries, 3);
    EXPECT_EQ(loaded.errorThreshold, 10);
    EXPECT_EQ(loaded.defaultResolution, model::Resolution::r1080p);
}

TEST_F(AppConfigTest, LayersFileThenEnvironmentThenCommandLine) {
    const auto file = dir.path() / "bulkfetch.json";
    bulkfetch::testing::writeFile(file, R"({
        "proxyListUrl": "https://from-file/list",
        "probeItem": "fileitem123",
        "maxConcurrent": 3,
        "maxRetries": 4,
        "proxyMinSpeed": 2.5,
        "refreshMinutes": 15,
        "downloader": "http",
        "urlTemplate": "https://cdn.example/{id}.mp4",
        "wantAudio": false
    })");
    setEnv("BULKFETCH_MAX_RETRIES", "6");
    setEnv("BULKFETCH_PROXY_USERNAME", "acct");

    auto loaded = config::loadAppConfig(options({"ids.txt", "--config", file.string(), "--max-concurrent", "9"}));
    EXPECT_EQ(loaded.proxyListUrl, "https://from-file/list");
    EXPECT_EQ(loaded.maxConcurrent, 9u);
    EXPECT_EQ(loaded.maxRetries, 6);
    EXPECT_DOUBLE_EQ(loaded.proxyMinSpeed, 2.5);
    EXPECT_DOUBLE_EQ(loaded.minThroughputBytesPerSec(), 2.5 * 1024 * 1024);
    EXPECT_EQ(loaded.refreshInterval, std::chrono::minutes{15});
    EXPECT_EQ(loaded.downloader, config::DownloaderKind::http);
    EXPECT_FALSE(loaded.wantAudio);
    EXPECT_EQ(loaded.proxyUsername, "acct");
}

TEST_F(AppConfigTest, ConfigFileFromEnvironment) {
    const auto file = dir.path() / "env.json";
    bulkfetch::testing::writeFile(file, R"({"proxyListUrl": "list.txt", "probeItem": "x", "errorThreshold": 4})");
    setEnv("BULKFETCH_CONFIG", file.string().c_str());

    EXPECT_EQ(config::loadAppConfig(options({"ids.txt"})).errorThreshold, 4);
}

TEST_F(AppConfigTest, BrokenConfigFilesAreReported) {
    EXPECT_THROW(config::loadAppConfig(options({"ids.txt", "--config", (dir.path() / "nope.json").string()})),
                 config::ConfigError);

    const auto broken = dir.path() / "broken.json";
    bulkfetch::testing::writeFile(broken, "{\"maxConcurrent\": ");
    EXPECT_THROW(config::loadAppConfig(options({"ids.txt", "--config", broken.string()})), config::ConfigError);

    const auto array = dir.path() / "array.json";
    bulkfetch::testing::writeFile(array, "[1, 2]");
    EXPECT_THROW(config::loadAppConfig(options({"ids.txt", "--config", array.string()})), config::ConfigError);
}

TEST_F(AppConfigTest, MalformedEnvironmentValuesAreRejected) {
    setEnv("BULKFETCH_PROXY_LIST_URL", "list.txt");
    setEnv("BULKFETCH_TEST_ITEM", "x");
    setEnv("BULKFETCH_MAX_CONCURRENT", "4x");
    EXPECT_THROW(config::loadAppConfig(options({"ids.txt"})), config::ConfigError);

    setEnv("BULKFETCH_MAX_CONCURRENT", "4");
    setEnv("BULKFETCH_WANT_VIDEO", "maybe");
    EXPECT_THROW(config::loadAppConfig(options({"ids.txt"})), config::ConfigError);

    setEnv("BULKFETCH_WANT_VIDEO", "off");
    setEnv("BULKFETCH_DEFAULT_RESOLUTION", "480P");
    auto loaded = config::loadAppConfig(options({"ids.txt"}));
    EXPECT_FALSE(loaded.wantVideo);
    EXPECT_EQ(loaded.defaultResolution, model::Resolution::r480p);
}

TEST_F(AppConfigTest, ValidateRejectsOutOfRangeValues) {
    config::AppConfig base;
    base.proxyListUrl = "list.txt";
    base.probeItem = "x";
    EXPECT_NO_THROW(base.validate());

    auto broken = base;
    broken.maxRetries = 0;
    EXPECT_THROW(broken.validate(), config::ConfigError);

    broken = base;
    broken.proxyMinSpeed = 0.0;
    EXPECT_THROW(broken.validate(), config::ConfigError);

    broken = base;
    broken.urlTemplate = "https://example.com/watch";
    EXPECT_THROW(broken.validate(), config::ConfigError);

    broken = base;
    broken.probeMinBytes = 4096;
    broken.probeMaxBytes = 1024;
    EXPECT_THROW(broken.validate(), config::ConfigError);
}

TEST_F(AppConfigTest, DerivedValues) {
    config::AppConfig config;
    config.maxConcurrent = 5;
    EXPECT_EQ(config.effectivePerProxyLimit(), 2u);
    config.maxConcurrent = 1;
    EXPECT_EQ(config.effectivePerProxyLimit(), 1u);
    config.perProxyLimit = 7;
    EXPECT_EQ(config.effectivePerProxyLimit(), 7u);

    config.workDir = "/srv/run";
    EXPECT_EQ(config.effectiveOutputDir(), std::filesystem::path{"/srv/run/output"});
    EXPECT_EQ(config.cacheDir(), std::filesystem::path{"/srv/run/cache"});
    EXPECT_EQ(config.downloadsDir(), std::filesystem::path{"/srv/run/downloads"});
    config.outputDir = "/mnt/archive";
    EXPECT_EQ(config.effectiveOutputDir(), std::filesystem::path{"/mnt/archive"});
}

TEST_F(AppConfigTest, BucketSelectsObjectStorageAndNeedsCredentials) {
    setEnv("BULKFETCH_PROXY_LIST_URL", "https://proxies.example/list");
    setEnv("BULKFETCH_TEST_ITEM", "dQw4w9WgXcQ");
    const auto file = dir.path() / "s3.json";
    bulkfetch::testing::writeFile(file, R"({"bucket": "from-file", "s3Endpoint": "http://minio:9000", "s3PathStyle": true})");

    EXPECT_THROW(config::loadAppConfig(options({"ids.txt", "--config", file.string()})), config::ConfigError);

    setEnv("AWS_ACCESS_KEY_ID", "AKID");
    setEnv("AWS_SECRET_ACCESS_KEY", "secret");
    setEnv("BULKFETCH_STORAGE_PREFIX", "media");
    auto loaded = config::loadAppConfig(options({"ids.txt", "--config", file.string(), "--bucket", "from-cli"}));
    EXPECT_EQ(loaded.bucket, "from-cli");
    EXPECT_EQ(loaded.s3Endpoint, "http://minio:9000");
    EXPECT_TRUE(loaded.s3PathStyle);
    EXPECT_EQ(loaded.s3Region, "us-east-1");
    EXPECT_EQ(loaded.storagePrefix, "media");
    EXPECT_EQ(loaded.s3AccessKeyId, "AKID");
    EXPECT_EQ(loaded.s3SecretAccessKey, "secret");

    EXPECT_THROW(options({"ids.txt", "--bucket"}), config::ConfigError);
}
