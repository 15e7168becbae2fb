#pragma once

#include "karta/core/types.h"

#include <cstdint>
#include <vector>

namespace karta {

struct GridSettings {
    float size = 20.0f;
    bool snapEnabled = false;
    bool snapToObjects = false;
    // Document units.
    float objectSnapThreshold = 8.0f;
};

enum class GuideType : std::uint8_t {
    Vertical = 0,
    Horizontal = 1
};

struct SnapGuide {
    GuideType type{GuideType::Vertical};
    float position{0.0f};
    ObjectId sourceId;
};

struct SnapResult {
    float x{0.0f};
    float y{0.0f};
    std::vector<SnapGuide> guides;
};

inline bool isGridSnapEnabled(const GridSettings& grid) {
    return grid.snapEnabled && grid.size > 0.0001f;
}

} // namespace karta
