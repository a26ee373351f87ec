#include "bulkfetch/model/Resolution.hpp"

#include "bulkfetch/util/CommonUtil.hpp"

#include <array>

namespace bulkfetch::model {
namespace {

struct ResolutionEntry {
    Resolution resolution;
    std::string_view name;
    int height;
};

// 按高度降序排列。
constexpr std::array<ResolutionEntry, 5> kResolutions{{
    {Resolution::r4k, "4K", 2160},
    {Resolution::r1080p, "1080p", 1080},
    {Resolution::r720p, "720p", 720},
    {Resolution::r480p, "480p", 480},
    {Resolution::r360p, "360p", 360},
}};

const ResolutionEntry& entryOf(Resolution resolution) {
    for (const auto& entry : kResolutions) {
        if (entry.resolution == resolution) {
            return entry;
        }
    }
    return kResolutions.back();
}

} // namespace

int heightOf(Resolution resolution) {
    return entryOf(resolution).height;
}

std::string toString(Resolution resolution) {
    return std::string(entryOf(resolution).name);
}

std::optional<Resolution> parseResolution(std::string_view name) {
    const auto lower = util::toLower(util::trimView(name));
    for (const auto& entry : kResolutions) {
        if (util::toLower(entry.name) == lower) {
            return entry.resolution;
        }
    }
    if (lower == "2160p") {
        return Resolution::r4k;
    }
    return std::nullopt;
}

Resolution resolutionFromHeight(int height) {
    for (const auto& entry : kResolutions) {
        if (height >= entry.height) {
            return entry.resolution;
        }
    }
    return Resolution::r360p;
}

} // namespace bulkfetch::model
