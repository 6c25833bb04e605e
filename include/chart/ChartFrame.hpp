#pragma once
#include "ChartLayoutEngine.hpp"
#include "ColorAssigner.hpp"
#include "data/TimeSeriesStore.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Everything a renderer needs to draw one chart panel, reduced to
// rectangles, colors and strings. Built once per frame from a series
// snapshot; the UI layer only maps it onto widgets.

enum class PanelState {
    NeedsCredentials,   // no admin key for the provider
    Error,              // last fetch for this metric failed
    Loading,            // first fetch still running
    NoData,             // fetch succeeded but the window is empty
    NoSpace,            // terminal too small for a single bar
    Ready
};

struct LegendEntry {
    std::string key;          // category key (model, line item or key id)
    std::string label;        // display text (resolved key name, abbreviation)
    Rgb         color;
    double      total = 0.0;
    uint64_t    inputTokens  = 0;
    uint64_t    outputTokens = 0;
};

struct BarSegmentFrame {
    SegmentGeometry geometry;
    Rgb             color;
    std::string     valueLabel;   // empty unless segment values are shown and fit
};

struct BarFrame {
    CalendarDate date;
    std::string  dateLabel;
    std::string  totalLabel;      // empty when the total is zero
    double       total  = 0.0;
    int          x      = 0;      // column offset inside the chart area
    bool         capped = false;  // drawn at full height, total highlighted
    std::vector<BarSegmentFrame> segments;
};

struct ChartFrame {
    PanelState  state  = PanelState::NoData;
    Metric      metric = Metric::Cost;
    std::string title;
    std::string message;

    std::string legendTitle;
    std::vector<LegendEntry> legend;

    int chartWidth    = 0;
    int chartHeight   = 0;
    int barAreaHeight = 0;
    int barWidth      = 0;

    size_t totalBars = 0;
    std::optional<ChartLayout> layout;
    SmartScale scale;
    std::vector<BarFrame> bars;
    std::optional<ScrollThumb> thumb;
};

struct ChartRequest {
    Provider provider = Provider::OpenAI;
    Metric   metric   = Metric::Cost;
    GroupBy  groupBy  = GroupBy::Model;
    std::optional<std::string> filter;

    bool hasCredentials = false;
    bool inFlight       = false;
    std::optional<std::string> error;

    const SeriesSnapshot* series   = nullptr;
    const ColorTable*     colors   = nullptr;
    const std::map<std::string, std::string>* keyNames = nullptr;

    int    width  = 0;        // inner panel size, legend included
    int    height = 0;
    size_t scrollOffset = kScrollToEnd;
    bool   showSegmentValues = false;
};

class ChartFrameBuilder {
public:
    static constexpr int    kLegendWidth           = 50;
    static constexpr int    kDateLabelHeight       = 1;
    static constexpr int    kTotalLabelHeight      = 1;
    static constexpr int    kScrollbarHeight       = 1;
    static constexpr double kLegendCostThreshold   = 1.0;

    explicit ChartFrameBuilder(const ChartLayoutEngine& engine);

    ChartFrame build(const ChartRequest& req) const;

    static std::string panelTitle(const ChartRequest& req);

private:
    const ChartLayoutEngine& engine_;

    std::vector<LegendEntry> buildLegend(const ChartRequest& req) const;
    std::string displayName(const ChartRequest& req, const std::string& key) const;
    std::string valueText(Metric metric, double value, bool total) const;
};
