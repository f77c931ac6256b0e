#pragma once

#include <cstdint>

namespace ledmatrix {

// 24-bit RGB color, no alpha
struct Color {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;

    bool operator==(const Color&) const = default;
};

inline constexpr Color COLOR_BLACK{0, 0, 0};
inline constexpr Color COLOR_WHITE{255, 255, 255};

} // namespace ledmatrix
