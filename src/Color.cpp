#include "Color.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace GridPlanner {

static int ToByte(float component) {
    return static_cast<int>(
        std::lround(std::clamp(component, 0.0f, 1.0f) * 255.0f));
}

Color Color::FromHex(const std::string& hex) {
    if (hex.empty() || hex[0] != '#') {
        return Color(0, 0, 0, 1);
    }
    
    std::string str = hex.substr(1);
    if (str.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        return Color(0, 0, 0, 1);
    }
    
    uint32_t val = 0;
    sscanf(str.c_str(), "%x", &val);
    
    if (str.length() == 6) {
        // #RRGGBB
        return Color(
            ((val >> 16) & 0xFF) / 255.0f,
            ((val >> 8) & 0xFF) / 255.0f,
            (val & 0xFF) / 255.0f,
            1.0f
        );
    } else if (str.length() == 8) {
        // #RRGGBBAA
        return Color(
            ((val >> 24) & 0xFF) / 255.0f,
            ((val >> 16) & 0xFF) / 255.0f,
            ((val >> 8) & 0xFF) / 255.0f,
            (val & 0xFF) / 255.0f
        );
    }
    
    return Color(0, 0, 0, 1);
}

std::string Color::ToHex(bool includeAlpha) const {
    char buf[16];
    if (includeAlpha) {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x",
            ToByte(r), ToByte(g), ToByte(b), ToByte(a));
    } else {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x",
            ToByte(r), ToByte(g), ToByte(b));
    }
    return buf;
}

Color Color::Clamped() const {
    return Color(
        std::clamp(r, 0.0f, 1.0f),
        std::clamp(g, 0.0f, 1.0f),
        std::clamp(b, 0.0f, 1.0f),
        std::clamp(a, 0.0f, 1.0f)
    );
}

} // namespace GridPlanner
