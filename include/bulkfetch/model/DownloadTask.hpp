#pragma once

#include "bulkfetch/model/Resolution.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bulkfetch::model {

// wantVideo 与 wantAudio 均为 false 时表示取最小可用格式，用于测速。
struct DownloadConstraints {
    Resolution maxResolution{Resolution::r1080p};
    bool wantVideo{true};
    bool wantAudio{true};
};

// ID 会被拼进暂存和输出路径：拒绝空串、"."、".."、路径分隔符和控制字符。
bool isSafeItemId(std::string_view itemId);

struct DownloadTask {
    std::string itemId;
    std::filesystem::path workDirectory;
    DownloadConstraints constraints;
    // 0 表示使用下载器自身的超时配置。
    std::chrono::seconds timeout{};
};

enum class FailureKind {
    no_healthy_proxy,
    network_timeout,
    proxy_transfer,
    storage_transient,
    item_not_found,
    item_restricted,
    malformed_id,
    internal
};

std::string toString(FailureKind kind);
bool isRetryable(FailureKind kind);
// 仅网络层面的失败记到代理头上，条目本身的问题不惩罚代理。
bool penalizesProxy(FailureKind kind);

struct Failure {
    FailureKind kind{FailureKind::internal};
    std::string detail;
};

std::string describe(const Failure& failure);

struct Artifact {
    std::vector<std::filesystem::path> files;
    std::uintmax_t bytes{};
    std::chrono::milliseconds elapsed{};
    boost::json::object metadata;
};

enum class FetchStatus {
    success,
    retryable,
    fatal
};

struct FetchResult {
    FetchStatus status{FetchStatus::fatal};
    Artifact artifact;
    Failure failure;

    static FetchResult ok(Artifact artifact);
    static FetchResult failed(FailureKind kind, std::string detail);
};

struct StoreResult {
    bool success{};
    std::string error;
};

enum class AttemptOutcome {
    success,
    retryable_error,
    fatal_error
};

const char* toString(AttemptOutcome outcome);

struct DownloadAttempt {
    int number{};
    std::string proxyKey;
    AttemptOutcome outcome{AttemptOutcome::fatal_error};
    Failure failure;
};

DownloadAttempt makeAttempt(int number, std::string proxyKey, const FetchResult& result);

} // namespace bulkfetch::model
