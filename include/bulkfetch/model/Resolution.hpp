#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bulkfetch::model {

enum class Resolution {
    r4k,
    r1080p,
    r720p,
    r480p,
    r360p
};

int heightOf(Resolution resolution);
std::string toString(Resolution resolution);
std::optional<Resolution> parseResolution(std::string_view name);

// 不超过 height 的最大档位，低于所有档位时返回 360p。
Resolution resolutionFromHeight(int height);

} // namespace bulkfetch::model
