#pragma once
#include "data/Records.hpp"
#include <cstdint>
#include <vector>

struct Rgb {
    uint8_t r = 0, g = 0, b = 0;

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

// Per-provider theme. Chart colors are indexed by ColorAssigner.
struct ColorPalette {
    Rgb primary;
    Rgb accent;
    Rgb error;
    Rgb selectedBg;
    Rgb selectedFg;
    Rgb emptyMarker;
    std::vector<Rgb> chartColors;

    static ColorPalette forProvider(Provider p);
};
