#include "ui/ChartGrid.hpp"
#include <algorithm>
#include <set>

namespace {
constexpr const char kAsciiFills[] = "#=%*+o@x&$";
}

std::map<std::string, char> ChartGrid::asciiGlyphs(const ChartFrame& frame) {
    std::set<std::string> keys;
    for (auto& e : frame.legend)
        keys.insert(e.key);
    for (auto& bar : frame.bars)
        for (auto& seg : bar.segments)
            keys.insert(seg.geometry.category);

    std::map<std::string, char> glyphs;
    size_t i = 0;
    const size_t n = sizeof(kAsciiFills) - 1;
    for (auto& k : keys)
        glyphs[k] = kAsciiFills[i++ % n];
    return glyphs;
}

void ChartGrid::putCentered(GridRow& row, int x, int width, const std::string& text,
                            std::optional<Rgb> fg, std::optional<Rgb> bg, bool bold)
{
    int len = static_cast<int>(text.size());
    if (width <= 0 || len == 0) return;
    if (len > width) len = width;

    int start = x + (width - len) / 2;
    for (int i = 0; i < len; i++) {
        int col = start + i;
        if (col < 0 || col >= static_cast<int>(row.size())) continue;
        auto& cell = row[col];
        cell.glyph = std::string(1, text[i]);
        cell.fg    = fg;
        if (bg) cell.bg = bg;
        cell.bold  = bold;
    }
}

std::vector<GridRow> ChartGrid::build(const ChartFrame& frame,
                                      const ColorPalette& palette, Mode mode)
{
    if (frame.state != PanelState::Ready || frame.chartWidth <= 0 || frame.chartHeight <= 0)
        return {};

    const int width  = frame.chartWidth;
    const int height = frame.chartHeight;
    const int barArea = frame.barAreaHeight;
    const bool ascii  = mode == Mode::Ascii;
    const Rgb white{0xFF, 0xFF, 0xFF};
    const Rgb black{0x00, 0x00, 0x00};

    std::vector<GridRow> grid(height, GridRow(width));
    auto glyphs = ascii ? asciiGlyphs(frame) : std::map<std::string, char>{};

    // Bar row k (0 = baseline) lives at grid row barArea - k
    auto gridRowFor = [&](int k) { return barArea - k; };

    for (auto& bar : frame.bars) {
        int usedHeight = 0;

        for (auto& seg : bar.segments) {
            const auto& g = seg.geometry;
            std::string fill = ascii ? std::string(1, glyphs[g.category]) : " ";

            for (int k = g.bottom; k < g.bottom + g.height; k++) {
                int r = gridRowFor(k);
                if (r < 1 || r > barArea) continue;
                for (int c = bar.x; c < bar.x + frame.barWidth && c < width; c++) {
                    auto& cell = grid[r][c];
                    cell.glyph = fill;
                    if (!ascii) cell.bg = seg.color;
                }
            }

            if (!seg.valueLabel.empty() && !ascii) {
                int mid = gridRowFor(g.bottom + (g.height - 1) / 2);
                if (mid >= 1 && mid <= barArea)
                    putCentered(grid[mid], bar.x, frame.barWidth, seg.valueLabel,
                                black, seg.color, true);
            }
            usedHeight = std::max(usedHeight, g.bottom + g.height);
        }

        // Zero-height bar: one muted row so the date is not an empty gap
        if (usedHeight == 0 && barArea > 0) {
            int r = gridRowFor(0);
            for (int c = bar.x; c < bar.x + frame.barWidth && c < width; c++) {
                grid[r][c].glyph = ascii ? "_" : " ";
                if (!ascii) grid[r][c].bg = palette.emptyMarker;
            }
        }

        if (!bar.totalLabel.empty() && usedHeight > 0) {
            int r = gridRowFor(usedHeight);
            std::string label = bar.totalLabel;
            if (ascii && bar.capped) label += "^";
            putCentered(grid[r], bar.x, frame.barWidth, label,
                        bar.capped ? palette.accent : white, std::nullopt, true);
        }

        putCentered(grid[barArea + 1], bar.x, frame.barWidth, bar.dateLabel,
                    white, std::nullopt, false);
    }

    if (frame.thumb && height >= barArea + 3) {
        auto& row = grid[barArea + 2];
        for (int c = 0; c < width; c++) {
            bool thumb = c >= frame.thumb->position &&
                         c < frame.thumb->position + frame.thumb->size;
            row[c].glyph = ascii ? (thumb ? "=" : "-") : (thumb ? "━" : "─");
            row[c].fg    = thumb ? palette.accent : palette.emptyMarker;
        }
    }
    return grid;
}

std::string ChartGrid::rowText(const GridRow& row) {
    std::string out;
    for (auto& cell : row) out += cell.glyph;
    return out;
}
