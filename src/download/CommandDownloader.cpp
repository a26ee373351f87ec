#include "bulkfetch/download/CommandDownloader.hpp"

#include "bulkfetch/model/Resolution.hpp"
#include "bulkfetch/util/CommonUtil.hpp"
#include "bulkfetch/util/JsonUtil.hpp"
#include "bulkfetch/util/Logging.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace bulkfetch::download {
namespace {

constexpr std::size_t kOutputTailLimit = 16 * 1024;
constexpr int kTimeoutExitCode = 124;
constexpr int kKilledExitCode = 137;

constexpr std::array<std::string_view, 7> kNotFoundKeywords{
    "Video unavailable",
    "This video has been removed",
    "does not exist",
    "HTTP Error 404",
    "Incomplete YouTube ID",
    "is not a valid URL",
    "Unable to extract"};

constexpr std::array<std::string_view, 7> kRestrictedKeywords{
    "Private video",
    "Sign in to confirm your age",
    "members-only",
    "Join this channel",
    "not available in your country",
    "blocked it on copyright grounds",
    "HTTP Error 403: Forbidden"};

constexpr std::array<std::string_view, 6> kProxyKeywords{
    "ProxyError",
    "Tunnel connection failed",
    "Unable to connect to proxy",
    "407 Proxy Authentication Required",
    "Sign in to confirm you",
    "HTTP Error 429"};

constexpr std::array<std::string_view, 4> kTimeoutKeywords{
    "timed out",
    "Read timed out",
    "TimeoutError",
    "The read operation timed out"};

struct PipeCloser {
    void operator()(FILE* pipe) const noexcept {
        if (pipe) {
            pclose(pipe);
        }
    }
};

std::string lastLine(std::string_view output) {
    auto trimmed = util::trimView(output);
    auto pos = trimmed.find_last_of('\n');
    auto line = pos == std::string_view::npos ? trimmed : trimmed.substr(pos + 1);
    return std::string(util::trimView(line));
}

void removeDirectory(const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
    if (ec) {
        util::log(util::LogLevel::warn, "清理目录失败 " + directory.string() + ": " + ec.message());
    }
}

} // namespace

CommandDownloader::CommandDownloader(CommandDownloaderConfig config)
    : config_(std::move(config)) {
    if (config_.command.empty()) {
        throw std::invalid_argument("downloader command must not be empty");
    }
}

std::string CommandDownloader::formatSelector(const model::DownloadConstraints& constraints) {
    const auto height = std::to_string(model::heightOf(constraints.maxResolution));
    if (constraints.wantVideo && constraints.wantAudio) {
        return "bestvideo[height<=" + height + "][ext=mp4]+bestaudio[ext=m4a]";
    }
    if (constraints.wantVideo) {
        return "bestvideo[height<=" + height + "][ext=mp4]";
    }
    if (constraints.wantAudio) {
        return "bestaudio[ext=m4a]";
    }
    return "worst";
}

model::FailureKind CommandDownloader::classifyOutput(std::string_view output) {
    if (util::containsKeyword(output, kProxyKeywords)) {
        return model::FailureKind::proxy_transfer;
    }
    if (util::containsKeyword(output, kTimeoutKeywords)) {
        return model::FailureKind::network_timeout;
    }
    if (util::containsKeyword(output, kRestrictedKeywords)) {
        return model::FailureKind::item_restricted;
    }
    if (util::containsKeyword(output, kNotFoundKeywords)) {
        return model::FailureKind::item_not_found;
    }
    return model::FailureKind::proxy_transfer;
}

std::string CommandDownloader::buildCommand(const model::DownloadTask& task,
                                            const proxy::ProxyEndpoint& proxy,
                                            const std::string& outputTemplate) const {
    const auto timeout = task.timeout.count() > 0 ? task.timeout : config_.timeout;
    const auto url = util::replaceAll(config_.urlTemplate, "{id}", task.itemId);

    std::string command = "timeout --kill-after=10 " + std::to_string(timeout.count()) + " ";
    command += config_.command;
    command += " --no-progress --no-warnings --no-playlist --newline";
    command += " --proxy " + util::shellQuote(proxy.url());
    command += " -f " + util::shellQuote(formatSelector(task.constraints));
    if (task.constraints.wantVideo || task.constraints.wantAudio) {
        command += " --write-info-json";
    }
    if (task.constraints.wantVideo && task.constraints.wantAudio) {
        command += " --merge-output-format mp4";
    }
    command += " -o " + util::shellQuote(outputTemplate);
    for (const auto& arg : config_.extraArgs) {
        command += " " + util::shellQuote(arg);
    }
    command += " -- " + util::shellQuote(url);
    command += " 2>&1";
    return command;
}

model::FetchResult CommandDownloader::fetch(const model::DownloadTask& task, const proxy::ProxyEndpoint& proxy) {
    if (!model::isSafeItemId(task.itemId)) {
        return model::FetchResult::failed(model::FailureKind::malformed_id, "id is not usable as a file name");
    }
    const auto directory = task.workDirectory / task.itemId;
    const auto start = std::chrono::steady_clock::now();

    try {
        removeDirectory(directory);
        std::filesystem::create_directories(directory);
        const auto command = buildCommand(task, proxy, (directory / "%(id)s.%(ext)s").string());
        // 日志中的代理地址不带凭据。
        const auto logged = util::replaceAll(command, util::shellQuote(proxy.url()), util::shellQuote(proxy.key()));
        util::log(util::LogLevel::debug, "执行下载命令: " + logged);

        std::unique_ptr<FILE, PipeCloser> pipe(popen(command.c_str(), "r"));
        if (!pipe) {
            return model::FetchResult::failed(model::FailureKind::internal, "popen failed for " + config_.command);
        }

        std::string output;
        std::array<char, 4096> buffer{};
        while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
            output += buffer.data();
            if (output.size() > kOutputTailLimit) {
                output.erase(0, output.size() - kOutputTailLimit);
            }
        }
        const int status = pclose(pipe.release());
        const int exitCode = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (exitCode != 0) {
            removeDirectory(directory);
            if (exitCode == kTimeoutExitCode || exitCode == kKilledExitCode) {
                return model::FetchResult::failed(model::FailureKind::network_timeout,
                                                  "download exceeded " + std::to_string(elapsed.count()) + "ms");
            }
            auto detail = lastLine(output);
            if (detail.empty()) {
                detail = config_.command + " exited with " + std::to_string(exitCode);
            }
            return model::FetchResult::failed(classifyOutput(output), detail);
        }

        model::Artifact artifact;
        artifact.elapsed = elapsed;
        for (const auto& entry : std::filesystem::directory_iterator(directory)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            const auto name = entry.path().filename().string();
            if (name.size() > 10 && name.compare(name.size() - 10, 10, ".info.json") == 0) {
                try {
                    if (auto info = util::readJsonFile(entry.path()); info && info->is_object()) {
                        const auto& obj = info->as_object();
                        for (const char* key : {"id", "title", "channel_id", "channel", "duration", "ext"}) {
                            if (auto it = obj.if_contains(key)) {
                                artifact.metadata[key] = *it;
                            }
                        }
                    }
                } catch (const std::exception& ex) {
                    util::log(util::LogLevel::warn, "解析 info.json 失败 id=" + task.itemId + ": " + ex.what());
                }
            }
            artifact.bytes += entry.file_size();
            artifact.files.push_back(entry.path());
        }

        if (artifact.files.empty()) {
            return model::FetchResult::failed(model::FailureKind::proxy_transfer,
                                              config_.command + " produced no output files");
        }
        if (!artifact.metadata.contains("id")) {
            artifact.metadata["id"] = task.itemId;
        }
        return model::FetchResult::ok(std::move(artifact));
    } catch (const std::exception& ex) {
        removeDirectory(directory);
        util::log(util::LogLevel::warn, "下载异常 id=" + task.itemId + " error=" + ex.what());
        return model::FetchResult::failed(model::FailureKind::internal, ex.what());
    }
}

} // namespace bulkfetch::download
