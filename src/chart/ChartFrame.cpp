#include "chart/ChartFrame.hpp"
#include "chart/Format.hpp"
#include <algorithm>

ChartFrameBuilder::ChartFrameBuilder(const ChartLayoutEngine& engine)
    : engine_(engine) {}

std::string ChartFrameBuilder::panelTitle(const ChartRequest& req) {
    std::string title = providerLabel(req.provider);
    if (req.metric == Metric::Cost)
        title += " - Daily Cost by Model";
    else
        title += " - Daily Token Usage by " + groupByLabel(req.groupBy);

    if (req.filter)
        title += " - " + *req.filter;
    return title;
}

ChartFrame ChartFrameBuilder::build(const ChartRequest& req) const {
    ChartFrame frame;
    frame.metric = req.metric;
    frame.title  = panelTitle(req);

    const std::string provider = providerLabel(req.provider);
    const std::string metric   = metricLabel(req.metric);

    // ── Panel states that replace the chart ───────────────────────
    if (req.error) {
        frame.state = PanelState::Error;
        frame.message = "Error loading " + provider + " " + metric +
                        " data: " + *req.error;
        return frame;
    }

    if (!req.hasCredentials) {
        frame.state = PanelState::NeedsCredentials;
        frame.message = "Connect an " + provider +
                        " Admin API key to view " + metric + " data.";
        return frame;
    }

    if (!req.series || req.series->empty()) {
        if (req.inFlight) {
            frame.state = PanelState::Loading;
            frame.message = "Loading " + provider + " " + metric + " data...";
        } else {
            frame.state = PanelState::NoData;
            frame.message = "No " + provider + " " + metric +
                            " data available for the selected window.";
        }
        return frame;
    }

    const SeriesSnapshot& series = *req.series;
    frame.legend = buildLegend(req);
    if (req.metric == Metric::Cost) {
        bool thresholded = std::any_of(frame.legend.begin(), frame.legend.end(),
            [](const LegendEntry& e) { return e.total >= kLegendCostThreshold; });
        frame.legendTitle = thresholded ? "Models (>$1)" : "Models";
    } else {
        frame.legendTitle = req.groupBy == GroupBy::ApiKeys ? "API Keys" : "Models";
    }

    // ── Geometry ──────────────────────────────────────────────────
    auto dates = series.dates();
    frame.totalBars   = dates.size();
    frame.chartWidth  = std::max(0, req.width - kLegendWidth);
    frame.chartHeight = std::max(0, req.height);
    frame.barAreaHeight = frame.chartHeight - kDateLabelHeight -
                          kTotalLabelHeight - kScrollbarHeight;

    auto noSpace = [&] {
        frame.state = PanelState::NoSpace;
        frame.message = "Not enough space to render " +
                        std::string(req.metric == Metric::Cost ? "cost" : "usage") +
                        " chart";
        return frame;
    };

    if (frame.barAreaHeight <= 0)
        return noSpace();

    frame.layout = engine_.layout(frame.totalBars, frame.chartWidth, req.scrollOffset);
    if (!frame.layout)
        return noSpace();

    const ChartLayout& layout = *frame.layout;
    frame.barWidth = layout.barWidth;

    std::vector<double> totals;
    totals.reserve(dates.size());
    for (auto& d : dates)
        totals.push_back(series.dateTotal(d));
    frame.scale = engine_.smartScale(totals);

    // ── Bars ──────────────────────────────────────────────────────
    for (size_t i = layout.startIndex; i < layout.endIndex(); i++) {
        const CalendarDate& date = dates[i];
        const auto& perCategory = series.daily.at(date);

        std::vector<std::pair<std::string, double>> ordered;
        for (auto& cat : series.categories) {
            auto it = perCategory.find(cat);
            if (it != perCategory.end())
                ordered.emplace_back(cat, it->second);
        }

        StackedBar stacked = ChartLayoutEngine::stack(ordered, frame.scale,
                                                      frame.barAreaHeight);

        BarFrame bar;
        bar.date      = date;
        bar.dateLabel = compactDateLabel(date.shortLabel(), layout.barWidth);
        bar.total     = totals[i];
        bar.x         = layout.barX(i - layout.startIndex);
        bar.capped    = stacked.capped;
        if (bar.total > 0.0)
            bar.totalLabel = valueText(req.metric, bar.total, true);

        for (auto& g : stacked.segments) {
            BarSegmentFrame seg;
            seg.geometry = g;
            seg.color    = req.colors ? ColorAssigner::lookup(*req.colors, g.category)
                                      : Rgb{0xFF, 0xFF, 0xFF};
            if (req.showSegmentValues) {
                auto text = valueText(req.metric, g.value, false);
                if (static_cast<int>(text.size()) <= layout.barWidth)
                    seg.valueLabel = std::move(text);
            }
            bar.segments.push_back(std::move(seg));
        }

        frame.bars.push_back(std::move(bar));
    }

    frame.thumb = ChartLayoutEngine::scrollbar(frame.chartWidth, frame.totalBars,
                                               layout.visibleCount, layout.startIndex);
    frame.state = PanelState::Ready;
    return frame;
}

std::vector<LegendEntry> ChartFrameBuilder::buildLegend(const ChartRequest& req) const {
    const SeriesSnapshot& series = *req.series;

    auto makeEntry = [&](const std::string& key) {
        LegendEntry e;
        e.key   = key;
        e.label = displayName(req, key);
        e.color = req.colors ? ColorAssigner::lookup(*req.colors, key)
                             : Rgb{0xFF, 0xFF, 0xFF};
        auto t = series.categoryTotals.find(key);
        if (t != series.categoryTotals.end()) e.total = t->second;
        auto s = series.tokenSplits.find(key);
        if (s != series.tokenSplits.end()) {
            e.inputTokens  = s->second.input;
            e.outputTokens = s->second.output;
        }
        return e;
    };

    std::vector<LegendEntry> entries;
    for (auto& key : series.categories) {
        auto e = makeEntry(key);
        if (req.metric == Metric::Cost && e.total < kLegendCostThreshold)
            continue;
        entries.push_back(std::move(e));
    }

    // Nothing reaches the threshold: show every category rather than nothing
    if (entries.empty()) {
        for (auto& key : series.categories)
            entries.push_back(makeEntry(key));
    }
    return entries;
}

std::string ChartFrameBuilder::displayName(const ChartRequest& req,
                                           const std::string& key) const {
    if (req.metric != Metric::Usage || req.groupBy != GroupBy::ApiKeys)
        return key;

    if (req.keyNames) {
        auto it = req.keyNames->find(key);
        if (it != req.keyNames->end() && !it->second.empty())
            return it->second;
    }
    return abbreviateApiKey(key);
}

std::string ChartFrameBuilder::valueText(Metric metric, double value, bool total) const {
    if (metric == Metric::Usage)
        return formatTokens(static_cast<uint64_t>(std::max(0.0, value)));
    if (total || value >= 10.0)
        return formatCurrency(value, 0);
    return formatCurrency(value, 2);
}
