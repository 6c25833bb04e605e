#pragma once
#include "app/DashboardController.hpp"
#include "chart/ChartFrame.hpp"
#include "chart/Palette.hpp"
#include <string>
#include <vector>

// Summary wording shared by the interactive UI and the plain-text report,
// plus the plain-text report itself (print mode).
class TextReport {
public:
    struct Line {
        std::string label;
        std::string value;
        int trend = 0;     // +1 growth, -1 decline, 0 neutral
    };

    static std::vector<Line> costLines(const DashboardSummary& s);
    static std::vector<Line> usageLines(const DashboardSummary& s);
    static std::string dateRange(const DashboardSummary& s);

    // "↑ 12.5%" / "↓ 3.0%"
    static std::string changeText(const PeriodChange& change);

    // Chart rows, then legend lines; non-ready frames print their message
    static std::string renderChart(const ChartFrame& frame, const ColorPalette& palette);

    static std::string renderProvider(const DashboardSummary& summary,
                                      const ChartFrame& cost,
                                      const ChartFrame& usage);
};
