#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Tunables for bar packing and outlier compression. The smart-scale
// thresholds are empirical; they are kept configurable rather than derived.
struct LayoutConfig {
    int    minBarWidth      = 5;
    int    maxBarWidth      = 20;
    int    barSpacing       = 1;
    double outlierThreshold = 3.0;   // compress when max > threshold * p75
    double outlierCap       = 2.0;   // display_max = cap * p75
};

// Horizontal placement of the visible window of bars
struct ChartLayout {
    size_t startIndex   = 0;
    size_t visibleCount = 0;
    int    barWidth     = 0;
    int    spacing      = 0;
    int    offset       = 0;     // left padding that centers the bars

    size_t endIndex() const { return startIndex + visibleCount; }
    int    usedWidth() const {
        return static_cast<int>(visibleCount) * barWidth +
               static_cast<int>(visibleCount > 0 ? visibleCount - 1 : 0) * spacing;
    }
    int    barX(size_t visibleIdx) const {
        return offset + static_cast<int>(visibleIdx) * (barWidth + spacing);
    }
};

// Vertical scale: bars taller than displayMax are drawn full height with
// their segments compressed, and flagged as capped.
struct SmartScale {
    double displayMax = 1.0;
    double actualMax  = 0.0;

    bool compressed() const { return actualMax > displayMax; }
    bool isCapped(double total) const { return total > displayMax; }
};

struct SegmentGeometry {
    std::string category;
    double value  = 0.0;
    int    height = 0;
    int    bottom = 0;   // rows above the bar's baseline
};

struct StackedBar {
    std::vector<SegmentGeometry> segments;   // bottom to top
    int  usedHeight = 0;
    bool capped     = false;
};

struct ScrollThumb {
    int position = 0;
    int size     = 1;
};

// Open position meaning "scrolled to the newest bars"; the layout clamps it
constexpr size_t kScrollToEnd = std::numeric_limits<size_t>::max();

class ChartLayoutEngine {
public:
    explicit ChartLayoutEngine(const LayoutConfig& config = {});

    // Largest number of bars (>= min width each) that fits `availableWidth`.
    // Empty when nothing fits, when there are no bars, or width is zero.
    std::optional<ChartLayout> layout(size_t totalBars, int availableWidth,
                                      size_t scrollOffset) const;

    // Applies a +/- delta to a scroll position, clamped to
    // [0, totalBars - visibleCount]
    static size_t scroll(size_t current, int delta,
                         size_t totalBars, size_t visibleCount);

    // Outlier-aware scale over per-date totals
    SmartScale smartScale(const std::vector<double>& totals) const;

    // 75th percentile (nearest rank) over the positive values
    static double percentile75(const std::vector<double>& values);

    // Splits one bar into stacked segments. `ordered` is in draw order
    // (bottom first); non-positive values get no segment.
    static StackedBar stack(const std::vector<std::pair<std::string, double>>& ordered,
                            const SmartScale& scale, int barAreaHeight);

    // Thumb for a horizontal scrollbar; empty when everything is visible
    static std::optional<ScrollThumb> scrollbar(int trackWidth, size_t totalBars,
                                                size_t visibleCount, size_t startIndex);

    const LayoutConfig& config() const { return config_; }

private:
    LayoutConfig config_;
};
