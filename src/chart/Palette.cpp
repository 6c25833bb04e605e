#include "chart/Palette.hpp"

ColorPalette ColorPalette::forProvider(Provider p) {
    ColorPalette pal;
    pal.emptyMarker = {0x4E, 0x4E, 0x4E};

    switch (p) {
        case Provider::Anthropic:
            pal.primary    = {0xCC, 0x78, 0x5C};
            pal.accent     = {0x61, 0xAA, 0xF2};
            pal.error      = {0xBF, 0x4D, 0x43};
            pal.selectedBg = {0xCC, 0x78, 0x5C};
            pal.selectedFg = {0xFF, 0xFF, 0xFF};
            pal.chartColors = {
                {0xCC, 0x78, 0x5C},
                {0xD4, 0xA2, 0x7F},
                {0xEB, 0xDB, 0xBC},
                {0xBF, 0x4D, 0x43},
                {0xE5, 0xE4, 0xDF},
                {0xF0, 0xF0, 0xEB},
            };
            break;

        case Provider::OpenAI:
            pal.primary    = {0x00, 0xCD, 0xCD};
            pal.accent     = {0x00, 0xCD, 0x00};
            pal.error      = {0xCD, 0x00, 0x00};
            pal.selectedBg = {0x00, 0xCD, 0xCD};
            pal.selectedFg = {0x00, 0x00, 0x00};
            pal.chartColors = {
                {0x3B, 0x78, 0xFF},
                {0x00, 0xCD, 0xCD},
                {0x00, 0xCD, 0x00},
                {0xCD, 0x00, 0xCD},
                {0xCD, 0xCD, 0x00},
                {0x87, 0xCE, 0xFA},
            };
            break;
    }
    return pal;
}
