#pragma once
#include "chart/ChartFrame.hpp"
#include "chart/Palette.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct GridCell {
    std::string         glyph = " ";
    std::optional<Rgb>  fg;
    std::optional<Rgb>  bg;
    bool                bold = false;

    bool sameStyle(const GridCell& o) const {
        return fg == o.fg && bg == o.bg && bold == o.bold;
    }
};

using GridRow = std::vector<GridCell>;

// Rasterizes a Ready chart frame into chartWidth x chartHeight cells:
// one total-label row, the bar area, the date row, the scrollbar row.
// Color mode paints segments with background colors; ASCII mode fills
// them with one glyph per category for plain-text output.
class ChartGrid {
public:
    enum class Mode { Color, Ascii };

    static std::vector<GridRow> build(const ChartFrame& frame,
                                      const ColorPalette& palette, Mode mode);

    // Category -> fill glyph used in ASCII mode
    static std::map<std::string, char> asciiGlyphs(const ChartFrame& frame);

    static std::string rowText(const GridRow& row);

private:
    static void putCentered(GridRow& row, int x, int width, const std::string& text,
                            std::optional<Rgb> fg, std::optional<Rgb> bg, bool bold);
};
