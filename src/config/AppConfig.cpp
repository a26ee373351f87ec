#include "bulkfetch/config/AppConfig.hpp"

#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/JsonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace bulkfetch::config {
namespace {

long long parseInteger(std::string_view name, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    const auto parsed = std::strtoll(value.c_str(), &end, 10);
    if (value.empty() || errno != 0 || end == nullptr || !util::trimView(end).empty()) {
        throw ConfigError(std::string(name) + ": expected an integer, got '" + value + "'");
    }
    return parsed;
}

double parseNumber(std::string_view name, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    const auto parsed = std::strtod(value.c_str(), &end);
    if (value.empty() || errno != 0 || end == nullptr || !util::trimView(end).empty()) {
        throw ConfigError(std::string(name) + ": expected a number, got '" + value + "'");
    }
    return parsed;
}

bool parseFlag(std::string_view name, const std::string& value) {
    const auto lower = util::toLower(util::trimView(value));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    throw ConfigError(std::string(name) + ": expected a boolean, got '" + value + "'");
}

model::Resolution parseResolutionOrThrow(std::string_view name, const std::string& value) {
    if (auto resolution = model::parseResolution(value)) {
        return *resolution;
    }
    throw ConfigError(std::string(name) + ": unknown resolution '" + value + "'");
}

DownloaderKind parseDownloaderKind(std::string_view name, const std::string& value) {
    const auto lower = util::toLower(util::trimView(value));
    if (lower == "command") {
        return DownloaderKind::command;
    }
    if (lower == "http") {
        return DownloaderKind::http;
    }
    throw ConfigError(std::string(name) + ": expected 'command' or 'http', got '" + value + "'");
}

template <typename T>
T nonNegative(std::string_view name, long long value) {
    if (value < 0) {
        throw ConfigError(std::string(name) + " must not be negative");
    }
    return static_cast<T>(value);
}

} // namespace

unsigned int AppConfig::effectivePerProxyLimit() const {
    if (perProxyLimit > 0) {
        return perProxyLimit;
    }
    return std::max(1u, maxConcurrent / 2);
}

std::filesystem::path AppConfig::effectiveOutputDir() const {
    return outputDir.empty() ? workDir / "output" : outputDir;
}

void AppConfig::validate() const {
    if (maxConcurrent == 0) {
        throw ConfigError("maxConcurrent must be positive");
    }
    if (maxRetries <= 0) {
        throw ConfigError("maxRetries must be positive");
    }
    if (errorThreshold <= 0) {
        throw ConfigError("errorThreshold must be positive");
    }
    if (!(proxyMinSpeed > 0.0)) {
        throw ConfigError("proxyMinSpeed must be positive");
    }
    if (deadThreshold <= 0) {
        throw ConfigError("deadThreshold must be positive");
    }
    if (probeConcurrency == 0) {
        throw ConfigError("probeConcurrency must be positive");
    }
    if (refreshInterval.count() <= 0) {
        throw ConfigError("refreshInterval must be positive");
    }
    if (probeMaxBytes != 0 && probeMaxBytes < probeMinBytes) {
        throw ConfigError("probeMaxBytes must not be below probeMinBytes");
    }
    if (util::trimView(proxyListUrl).empty()) {
        throw ConfigError("proxy list URL is required (BULKFETCH_PROXY_LIST_URL)");
    }
    if (util::trimView(probeItem).empty()) {
        throw ConfigError("probe reference item is required (BULKFETCH_TEST_ITEM)");
    }
    if (urlTemplate.find("{id}") == std::string::npos) {
        throw ConfigError("urlTemplate must contain {id}");
    }
    if (downloader == DownloaderKind::command && util::trimView(downloaderCommand).empty()) {
        throw ConfigError("downloaderCommand must not be empty");
    }
    if (!bucket.empty()) {
        if (s3AccessKeyId.empty() || s3SecretAccessKey.empty()) {
            throw ConfigError("bucket requires AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY");
        }
        if (util::trimView(s3Region).empty()) {
            throw ConfigError("s3Region must not be empty");
        }
    }
}

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    std::vector<std::string> positional;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        auto need = [&](const char* flag) -> const std::string& {
            if (i + 1 >= args.size()) {
                throw ConfigError(std::string("missing value for ") + flag);
            }
            return args[++i];
        };

        if (arg == "--config") options.configFile = need("--config");
        else if (arg == "--work-dir") options.workDir = need("--work-dir");
        else if (arg == "--output-dir") options.outputDir = need("--output-dir");
        else if (arg == "--max-resolution") options.maxResolution = parseResolutionOrThrow(arg, need("--max-resolution"));
        else if (arg == "--max-concurrent") {
            options.maxConcurrent = nonNegative<unsigned int>(arg, parseInteger(arg, need("--max-concurrent")));
        } else if (arg == "--max-retries") {
            options.maxRetries = nonNegative<int>(arg, parseInteger(arg, need("--max-retries")));
        } else if (arg == "--bucket") options.bucket = need("--bucket");
        else if (arg == "--no-video") options.noVideo = true;
        else if (arg == "--no-audio") options.noAudio = true;
        else if (arg == "-h" || arg == "--help") options.help = true;
        else if (arg.size() > 1 && arg.front() == '-') {
            throw ConfigError("unknown argument: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (options.help) {
        return options;
    }
    if (positional.empty()) {
        throw ConfigError("missing ID list file");
    }
    if (positional.size() > 2) {
        throw ConfigError("unexpected argument: " + positional[2]);
    }
    options.idFile = positional[0];
    if (positional.size() == 2) {
        options.idColumn = positional[1];
    }
    if (options.noVideo && options.noAudio) {
        throw ConfigError("--no-video and --no-audio cannot be combined");
    }
    return options;
}

void applyJson(AppConfig& config, const boost::json::object& json) {
    using util::getBool;
    using util::getDouble;
    using util::getInt;
    using util::getString;

    if (auto v = getInt(json, "maxConcurrent")) config.maxConcurrent = nonNegative<unsigned int>("maxConcurrent", *v);
    if (auto v = getInt(json, "maxRetries")) config.maxRetries = static_cast<int>(*v);
    if (auto v = getInt(json, "errorThreshold")) config.errorThreshold = static_cast<int>(*v);
    if (auto v = getInt(json, "perProxyLimit")) config.perProxyLimit = nonNegative<unsigned int>("perProxyLimit", *v);

    if (auto v = getString(json, "proxyListUrl")) config.proxyListUrl = *v;
    if (auto v = getString(json, "proxyScheme")) config.proxyScheme = *v;
    if (auto v = getString(json, "proxyUsername")) config.proxyUsername = *v;
    if (auto v = getString(json, "proxyPassword")) config.proxyPassword = *v;
    if (auto v = getDouble(json, "proxyMinSpeed")) config.proxyMinSpeed = *v;
    if (auto v = getInt(json, "deadThreshold")) config.deadThreshold = static_cast<int>(*v);
    if (auto v = getInt(json, "refreshMinutes")) config.refreshInterval = std::chrono::minutes{*v};
    if (auto v = getInt(json, "probeConcurrency")) config.probeConcurrency = nonNegative<unsigned int>("probeConcurrency", *v);

    if (auto v = getString(json, "probeItem")) config.probeItem = *v;
    if (auto v = getInt(json, "probeTimeout")) config.probeTimeout = std::chrono::seconds{*v};
    if (auto v = getInt(json, "probeMinBytes")) config.probeMinBytes = nonNegative<std::uint64_t>("probeMinBytes", *v);
    if (auto v = getInt(json, "probeMaxBytes")) config.probeMaxBytes = nonNegative<std::uint64_t>("probeMaxBytes", *v);

    if (auto v = getString(json, "downloader")) config.downloader = parseDownloaderKind("downloader", *v);
    if (auto v = getString(json, "downloaderCommand")) config.downloaderCommand = *v;
    if (auto v = getString(json, "urlTemplate")) config.urlTemplate = *v;
    if (auto v = getInt(json, "downloadTimeout")) config.downloadTimeout = std::chrono::seconds{*v};
    if (auto v = getString(json, "defaultResolution")) {
        config.defaultResolution = parseResolutionOrThrow("defaultResolution", *v);
    }
    if (auto v = getBool(json, "wantVideo")) config.wantVideo = *v;
    if (auto v = getBool(json, "wantAudio")) config.wantAudio = *v;
    if (auto v = getString(json, "idPattern")) config.idPattern = *v;

    if (auto v = getString(json, "workDir")) config.workDir = *v;
    if (auto v = getString(json, "outputDir")) config.outputDir = *v;
    if (auto v = getString(json, "logLevel")) config.logLevel = *v;
    if (auto v = getString(json, "logFile")) config.logFile = *v;

    if (auto v = getString(json, "bucket")) config.bucket = *v;
    if (auto v = getString(json, "s3Endpoint")) config.s3Endpoint = *v;
    if (auto v = getString(json, "s3Region")) config.s3Region = *v;
    if (auto v = getBool(json, "s3PathStyle")) config.s3PathStyle = *v;
    if (auto v = getString(json, "storagePrefix")) config.storagePrefix = *v;
}

void applyEnvironment(AppConfig& config) {
    auto env = [](const char* name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name)) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto v = env("BULKFETCH_MAX_CONCURRENT")) {
        config.maxConcurrent = nonNegative<unsigned int>("BULKFETCH_MAX_CONCURRENT", parseInteger("BULKFETCH_MAX_CONCURRENT", *v));
    }
    if (auto v = env("BULKFETCH_MAX_RETRIES")) config.maxRetries = static_cast<int>(parseInteger("BULKFETCH_MAX_RETRIES", *v));
    if (auto v = env("BULKFETCH_ERROR_THRESHOLD")) {
        config.errorThreshold = static_cast<int>(parseInteger("BULKFETCH_ERROR_THRESHOLD", *v));
    }
    if (auto v = env("BULKFETCH_PER_PROXY_LIMIT")) {
        config.perProxyLimit = nonNegative<unsigned int>("BULKFETCH_PER_PROXY_LIMIT", parseInteger("BULKFETCH_PER_PROXY_LIMIT", *v));
    }

    if (auto v = env("BULKFETCH_PROXY_LIST_URL")) config.proxyListUrl = *v;
    if (auto v = env("BULKFETCH_PROXY_SCHEME")) config.proxyScheme = *v;
    if (auto v = env("BULKFETCH_PROXY_USERNAME")) config.proxyUsername = *v;
    if (auto v = env("BULKFETCH_PROXY_PASSWORD")) config.proxyPassword = *v;
    if (auto v = env("BULKFETCH_PROXY_MIN_SPEED")) config.proxyMinSpeed = parseNumber("BULKFETCH_PROXY_MIN_SPEED", *v);
    if (auto v = env("BULKFETCH_PROXY_DEAD_THRESHOLD")) {
        config.deadThreshold = static_cast<int>(parseInteger("BULKFETCH_PROXY_DEAD_THRESHOLD", *v));
    }
    if (auto v = env("BULKFETCH_PROXY_REFRESH_MINUTES")) {
        config.refreshInterval = std::chrono::minutes{parseInteger("BULKFETCH_PROXY_REFRESH_MINUTES", *v)};
    }
    if (auto v = env("BULKFETCH_PROBE_CONCURRENCY")) {
        config.probeConcurrency =
            nonNegative<unsigned int>("BULKFETCH_PROBE_CONCURRENCY", parseInteger("BULKFETCH_PROBE_CONCURRENCY", *v));
    }

    if (auto v = env("BULKFETCH_TEST_ITEM")) config.probeItem = *v;
    if (auto v = env("BULKFETCH_PROBE_TIMEOUT")) {
        config.probeTimeout = std::chrono::seconds{parseInteger("BULKFETCH_PROBE_TIMEOUT", *v)};
    }
    if (auto v = env("BULKFETCH_PROBE_MIN_BYTES")) {
        config.probeMinBytes = nonNegative<std::uint64_t>("BULKFETCH_PROBE_MIN_BYTES", parseInteger("BULKFETCH_PROBE_MIN_BYTES", *v));
    }
    if (auto v = env("BULKFETCH_PROBE_MAX_BYTES")) {
        config.probeMaxBytes = nonNegative<std::uint64_t>("BULKFETCH_PROBE_MAX_BYTES", parseInteger("BULKFETCH_PROBE_MAX_BYTES", *v));
    }

    if (auto v = env("BULKFETCH_DOWNLOADER")) config.downloader = parseDownloaderKind("BULKFETCH_DOWNLOADER", *v);
    if (auto v = env("BULKFETCH_DOWNLOADER_COMMAND")) config.downloaderCommand = *v;
    if (auto v = env("BULKFETCH_URL_TEMPLATE")) config.urlTemplate = *v;
    if (auto v = env("BULKFETCH_DOWNLOAD_TIMEOUT")) {
        config.downloadTimeout = std::chrono::seconds{parseInteger("BULKFETCH_DOWNLOAD_TIMEOUT", *v)};
    }
    if (auto v = env("BULKFETCH_DEFAULT_RESOLUTION")) {
        config.defaultResolution = parseResolutionOrThrow("BULKFETCH_DEFAULT_RESOLUTION", *v);
    }
    if (auto v = env("BULKFETCH_WANT_VIDEO")) config.wantVideo = parseFlag("BULKFETCH_WANT_VIDEO", *v);
    if (auto v = env("BULKFETCH_WANT_AUDIO")) config.wantAudio = parseFlag("BULKFETCH_WANT_AUDIO", *v);
    if (auto v = env("BULKFETCH_ID_PATTERN")) config.idPattern = *v;

    if (auto v = env("BULKFETCH_WORK_DIR")) config.workDir = *v;
    if (auto v = env("BULKFETCH_OUTPUT_DIR")) config.outputDir = *v;
    if (auto v = env("BULKFETCH_LOG_LEVEL")) config.logLevel = *v;
    if (auto v = env("BULKFETCH_LOG_FILE")) config.logFile = *v;

    if (auto v = env("BULKFETCH_BUCKET")) config.bucket = *v;
    if (auto v = env("BULKFETCH_S3_ENDPOINT")) config.s3Endpoint = *v;
    if (auto v = env("BULKFETCH_S3_REGION")) config.s3Region = *v;
    if (auto v = env("BULKFETCH_S3_PATH_STYLE")) config.s3PathStyle = parseFlag("BULKFETCH_S3_PATH_STYLE", *v);
    if (auto v = env("BULKFETCH_STORAGE_PREFIX")) config.storagePrefix = *v;
    // 凭据只从标准 AWS 环境变量读取，不进配置文件。
    if (auto v = env("AWS_ACCESS_KEY_ID")) config.s3AccessKeyId = *v;
    if (auto v = env("AWS_SECRET_ACCESS_KEY")) config.s3SecretAccessKey = *v;
    if (auto v = env("AWS_SESSION_TOKEN")) config.s3SessionToken = *v;
}

void applyCommandLine(AppConfig& config, const CommandLineOptions& options) {
    config.idFile = options.idFile;
    config.idColumn = options.idColumn;
    if (options.workDir) config.workDir = *options.workDir;
    if (options.outputDir) config.outputDir = *options.outputDir;
    if (options.maxResolution) config.defaultResolution = *options.maxResolution;
    if (options.maxConcurrent) config.maxConcurrent = *options.maxConcurrent;
    if (options.maxRetries) config.maxRetries = *options.maxRetries;
    if (options.bucket) config.bucket = *options.bucket;
    if (options.noVideo) config.wantVideo = false;
    if (options.noAudio) config.wantAudio = false;
}

AppConfig loadAppConfig(const CommandLineOptions& options) {
    AppConfig config;

    std::optional<std::filesystem::path> configFile = options.configFile;
    if (!configFile) {
        if (const char* value = std::getenv("BULKFETCH_CONFIG")) {
            configFile = value;
        }
    }
    if (configFile) {
        if (!std::filesystem::exists(*configFile)) {
            throw ConfigError("config file not found: " + configFile->string());
        }
        std::optional<boost::json::value> json;
        try {
            json = util::readJsonFile(*configFile);
        } catch (const std::exception& ex) {
            throw ConfigError("cannot parse " + configFile->string() + ": " + ex.what());
        }
        if (json) {
            if (!json->is_object()) {
                throw ConfigError(configFile->string() + " must contain a JSON object");
            }
            applyJson(config, json->as_object());
        }
    }

    applyEnvironment(config);
    applyCommandLine(config, options);
    config.validate();
    return config;
}

std::string usage(std::string_view program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " <id-file> [id-column] [options]\n"
        << "Options:\n"
        << "  --config FILE          JSON configuration file (also BULKFETCH_CONFIG)\n"
        << "  --work-dir DIR         Directory holding cache/ and downloads/ (default: .)\n"
        << "  --output-dir DIR       Output tree (default: <work-dir>/output)\n"
        << "  --max-resolution R     4K, 1080p, 720p, 480p or 360p (default: 1080p)\n"
        << "  --bucket NAME          Upload to this S3 bucket instead of the output tree\n"
        << "  --no-video             Audio only\n"
        << "  --no-audio             Video only\n"
        << "  --max-concurrent N     Concurrent downloads (default: 5)\n"
        << "  --max-retries N        Retries per item (default: 3)\n"
        << "  -h, --help             Show this help\n"
        << "Required environment: BULKFETCH_PROXY_LIST_URL, BULKFETCH_TEST_ITEM\n";
    return oss.str();
}

} // namespace bulkfetch::config
