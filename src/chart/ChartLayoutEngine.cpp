#include "chart/ChartLayoutEngine.hpp"
#include <algorithm>
#include <cmath>

ChartLayoutEngine::ChartLayoutEngine(const LayoutConfig& config)
    : config_(config)
{
    config_.minBarWidth = std::max(1, config_.minBarWidth);
    config_.maxBarWidth = std::max(config_.minBarWidth, config_.maxBarWidth);
    config_.barSpacing  = std::max(0, config_.barSpacing);
}

std::optional<ChartLayout> ChartLayoutEngine::layout(
    size_t totalBars, int availableWidth, size_t scrollOffset) const
{
    if (totalBars == 0 || availableWidth <= 0)
        return std::nullopt;

    const size_t width   = static_cast<size_t>(availableWidth);
    const size_t spacing = static_cast<size_t>(config_.barSpacing);
    const size_t minW    = static_cast<size_t>(config_.minBarWidth);
    const size_t maxW    = static_cast<size_t>(config_.maxBarWidth);

    size_t visible = std::min(totalBars, width);

    while (visible > 0) {
        size_t requiredSpacing = spacing * (visible - 1);
        if (width <= requiredSpacing) {
            visible--;
            continue;
        }

        size_t barWidth = std::clamp((width - requiredSpacing) / visible, minW, maxW);
        size_t used = visible * barWidth + requiredSpacing;

        if (used <= width) {
            ChartLayout l;
            l.visibleCount = visible;
            l.barWidth     = static_cast<int>(barWidth);
            l.spacing      = static_cast<int>(spacing);
            l.offset       = static_cast<int>((width - used) / 2);
            l.startIndex   = std::min(scrollOffset, totalBars - visible);
            return l;
        }
        visible--;
    }

    return std::nullopt;
}

size_t ChartLayoutEngine::scroll(size_t current, int delta,
                                 size_t totalBars, size_t visibleCount)
{
    size_t maxStart = totalBars > visibleCount ? totalBars - visibleCount : 0;
    size_t pos = std::min(current, maxStart);

    if (delta < 0) {
        size_t step = static_cast<size_t>(-static_cast<long long>(delta));
        pos = step > pos ? 0 : pos - step;
    } else {
        pos = std::min(maxStart, pos + static_cast<size_t>(delta));
    }
    return pos;
}

double ChartLayoutEngine::percentile75(const std::vector<double>& values) {
    std::vector<double> positive;
    positive.reserve(values.size());
    for (double v : values)
        if (v > 0.0) positive.push_back(v);

    if (positive.empty()) return 0.0;

    std::sort(positive.begin(), positive.end());
    size_t rank = static_cast<size_t>(std::ceil(0.75 * positive.size()));
    rank = std::clamp<size_t>(rank, 1, positive.size());
    return positive[rank - 1];
}

SmartScale ChartLayoutEngine::smartScale(const std::vector<double>& totals) const {
    SmartScale s;
    for (double t : totals)
        s.actualMax = std::max(s.actualMax, t);

    double p75 = percentile75(totals);
    if (p75 > 0.0 && s.actualMax > config_.outlierThreshold * p75)
        s.displayMax = config_.outlierCap * p75;
    else
        s.displayMax = s.actualMax;

    if (s.displayMax <= 0.0)
        s.displayMax = 1.0;
    return s;
}

StackedBar ChartLayoutEngine::stack(
    const std::vector<std::pair<std::string, double>>& ordered,
    const SmartScale& scale, int barAreaHeight)
{
    StackedBar bar;
    if (barAreaHeight <= 0) return bar;

    double total = 0.0;
    for (auto& [cat, v] : ordered)
        if (v > 0.0) total += v;

    bar.capped = scale.isCapped(total);
    double factor = bar.capped ? scale.displayMax / total : 1.0;

    for (auto& [cat, v] : ordered) {
        if (v <= 0.0) continue;

        int remaining = barAreaHeight - bar.usedHeight;
        if (remaining <= 0) break;

        double scaled = v * factor;
        int h = static_cast<int>(std::lround(scaled / scale.displayMax * barAreaHeight));
        h = std::clamp(h, 1, remaining);

        bar.segments.push_back({cat, v, h, bar.usedHeight});
        bar.usedHeight += h;
    }
    return bar;
}

std::optional<ScrollThumb> ChartLayoutEngine::scrollbar(
    int trackWidth, size_t totalBars, size_t visibleCount, size_t startIndex)
{
    if (trackWidth <= 0 || visibleCount == 0 || totalBars <= visibleCount)
        return std::nullopt;

    ScrollThumb t;
    t.size = static_cast<int>(std::lround(
        static_cast<double>(trackWidth) * visibleCount / totalBars));
    t.size = std::clamp(t.size, 1, trackWidth);

    size_t maxStart = totalBars - visibleCount;
    size_t start = std::min(startIndex, maxStart);
    t.position = static_cast<int>(std::lround(
        static_cast<double>(trackWidth - t.size) * start / maxStart));
    return t;
}
