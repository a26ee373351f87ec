#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace bulkfetch::model {

enum class ItemStatus {
    pending,
    in_progress,
    complete,
    failed
};

struct ResumableRecord {
    std::string itemId;
    ItemStatus status{ItemStatus::pending};
    std::chrono::system_clock::time_point updatedAt{};
    int attempts{};
    std::string error;
};

inline const char* toString(ItemStatus status) {
    switch (status) {
    case ItemStatus::pending: return "PENDING";
    case ItemStatus::in_progress: return "IN_PROGRESS";
    case ItemStatus::complete: return "COMPLETE";
    case ItemStatus::failed: return "FAILED";
    }
    return "PENDING";
}

inline std::optional<ItemStatus> parseItemStatus(std::string_view text) {
    if (text == "PENDING") return ItemStatus::pending;
    if (text == "IN_PROGRESS") return ItemStatus::in_progress;
    if (text == "COMPLETE") return ItemStatus::complete;
    if (text == "FAILED") return ItemStatus::failed;
    return std::nullopt;
}

} // namespace bulkfetch::model
