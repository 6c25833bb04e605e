#include "ui/TextReport.hpp"
#include "chart/Format.hpp"
#include "ui/ChartGrid.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

std::string TextReport::changeText(const PeriodChange& change) {
    std::ostringstream out;
    out << (change.increased() ? "↑ " : "↓ ")
        << std::fixed << std::setprecision(1) << std::fabs(change.percent) << "%";
    return out.str();
}

std::vector<TextReport::Line> TextReport::costLines(const DashboardSummary& s) {
    std::vector<Line> lines;
    const std::string range = rangeLabel(s.range);

    lines.push_back({"Total (" + range + "): ", formatCurrency(s.cost.total)});
    lines.push_back({"Average per day: ", formatCurrency(s.cost.avgPerDay)});

    // Week-over-week only; a 30d comparison needs 60 days of history
    if (s.range == Range::SevenDays && s.cost.change) {
        lines.push_back({"Change from last week: ", changeText(*s.cost.change),
                         s.cost.change->increased() ? 1 : -1});
    }
    return lines;
}

std::vector<TextReport::Line> TextReport::usageLines(const DashboardSummary& s) {
    std::vector<Line> lines;
    const std::string range = rangeLabel(s.range);
    const auto& u = s.usage;

    lines.push_back({"Total Tokens (" + range + "): ", formatTokens(u.totalTokens())});
    lines.push_back({"Average per day: ",
                     formatTokens(static_cast<uint64_t>(std::llround(u.avgTokensPerDay)))});
    lines.push_back({"Input / Output: ",
                     formatTokens(u.inputTokens) + " / " + formatTokens(u.outputTokens)});

    if (s.range == Range::SevenDays && u.change) {
        lines.push_back({"Change from last week: ", changeText(*u.change),
                         u.change->increased() ? 1 : -1});
    }

    if (u.requests) {
        std::ostringstream avg;
        avg << std::fixed << std::setprecision(0) << u.avgRequestsPerDay;
        lines.push_back({"Requests (" + range + "): ", std::to_string(*u.requests)});
        lines.push_back({"Requests per day: ", avg.str()});
    }

    if (u.cacheHitRatePct) {
        std::ostringstream rate;
        rate << std::fixed << std::setprecision(1) << *u.cacheHitRatePct << "%";
        lines.push_back({"Cache hit rate: ", rate.str()});
    }
    return lines;
}

std::string TextReport::dateRange(const DashboardSummary& s) {
    auto bounds = s.cost.bounds ? s.cost.bounds : s.usage.bounds;
    if (!bounds) return "No data in selected range";
    return bounds->first.shortLabel() + " - " + bounds->second.shortLabel();
}

std::string TextReport::renderChart(const ChartFrame& frame, const ColorPalette& palette) {
    std::ostringstream out;
    out << "── " << frame.title << " ──\n";

    if (frame.state != PanelState::Ready) {
        out << "  " << frame.message << "\n";
        return out.str();
    }

    for (auto& row : ChartGrid::build(frame, palette, ChartGrid::Mode::Ascii))
        out << "  " << ChartGrid::rowText(row) << "\n";

    auto glyphs = ChartGrid::asciiGlyphs(frame);
    out << "  " << frame.legendTitle << "\n";
    for (auto& e : frame.legend) {
        out << "    " << glyphs[e.key] << " " << std::setw(32) << std::left << e.label;
        if (frame.metric == Metric::Usage)
            out << " In: " << formatTokens(e.inputTokens)
                << "  Out: " << formatTokens(e.outputTokens);
        else
            out << " " << formatLegendCost(e.total);
        out << "\n";
    }
    if (frame.scale.compressed())
        out << "  (^ capped at "
            << (frame.metric == Metric::Cost
                    ? formatCurrency(frame.scale.displayMax, 0)
                    : formatTokens(static_cast<uint64_t>(frame.scale.displayMax)))
            << ")\n";
    return out.str();
}

std::string TextReport::renderProvider(const DashboardSummary& summary,
                                       const ChartFrame& cost,
                                       const ChartFrame& usage)
{
    auto palette = ColorPalette::forProvider(summary.provider);
    std::ostringstream out;

    out << "╔══════════════════════════════════════════════════════════════╗\n";
    out << "║  SpendScope - " << std::setw(47) << std::left
        << providerLabel(summary.provider) << "║\n";
    out << "╚══════════════════════════════════════════════════════════════╝\n";

    out << "Cost: " << summary.costScope << "\n";
    for (auto& l : costLines(summary))
        out << "  " << l.label << l.value << "\n";

    out << "Usage: " << summary.usageScope << "\n";
    for (auto& l : usageLines(summary))
        out << "  " << l.label << l.value << "\n";

    out << "Date Range: " << dateRange(summary) << "\n\n";
    out << renderChart(cost, palette) << "\n";
    out << renderChart(usage, palette);
    return out.str();
}
