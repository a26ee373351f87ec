#include "bulkfetch/model/DownloadTask.hpp"

#include <utility>

namespace bulkfetch::model {

std::string toString(FailureKind kind) {
    switch (kind) {
    case FailureKind::no_healthy_proxy: return "no_healthy_proxy";
    case FailureKind::network_timeout: return "network_timeout";
    case FailureKind::proxy_transfer: return "proxy_transfer";
    case FailureKind::storage_transient: return "storage_transient";
    case FailureKind::item_not_found: return "item_not_found";
    case FailureKind::item_restricted: return "item_restricted";
    case FailureKind::malformed_id: return "malformed_id";
    case FailureKind::internal: return "internal";
    }
    return "internal";
}

bool isRetryable(FailureKind kind) {
    switch (kind) {
    case FailureKind::item_not_found:
    case FailureKind::item_restricted:
    case FailureKind::malformed_id:
        return false;
    default:
        return true;
    }
}

bool penalizesProxy(FailureKind kind) {
    return kind == FailureKind::network_timeout || kind == FailureKind::proxy_transfer;
}

bool isSafeItemId(std::string_view itemId) {
    if (itemId.empty() || itemId == "." || itemId == "..") {
        return false;
    }
    for (const char c : itemId) {
        if (c == '/' || c == '\\' || static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            return false;
        }
    }
    return true;
}

std::string describe(const Failure& failure) {
    if (failure.detail.empty()) {
        return toString(failure.kind);
    }
    return toString(failure.kind) + ": " + failure.detail;
}

FetchResult FetchResult::ok(Artifact artifact) {
    FetchResult result;
    result.status = FetchStatus::success;
    result.artifact = std::move(artifact);
    return result;
}

FetchResult FetchResult::failed(FailureKind kind, std::string detail) {
    FetchResult result;
    result.status = isRetryable(kind) ? FetchStatus::retryable : FetchStatus::fatal;
    result.failure = Failure{kind, std::move(detail)};
    return result;
}

const char* toString(AttemptOutcome outcome) {
    switch (outcome) {
    case AttemptOutcome::success: return "success";
    case AttemptOutcome::retryable_error: return "retryable_error";
    case AttemptOutcome::fatal_error: return "fatal_error";
    }
    return "fatal_error";
}

DownloadAttempt makeAttempt(int number, std::string proxyKey, const FetchResult& result) {
    DownloadAttempt attempt;
    attempt.number = number;
    attempt.proxyKey = std::move(proxyKey);
    switch (result.status) {
    case FetchStatus::success:
        attempt.outcome = AttemptOutcome::success;
        break;
    case FetchStatus::retryable:
        attempt.outcome = AttemptOutcome::retryable_error;
        attempt.failure = result.failure;
        break;
    case FetchStatus::fatal:
        attempt.outcome = AttemptOutcome::fatal_error;
        attempt.failure = result.failure;
        break;
    }
    return attempt;
}

} // namespace bulkfetch::model
