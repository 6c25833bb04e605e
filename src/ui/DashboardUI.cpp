#include "ui/DashboardUI.hpp"
#include "chart/Format.hpp"
#include "ui/ChartGrid.hpp"
#include "ui/TextReport.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

using namespace ftxui;

namespace {

Color toColor(const Rgb& c) { return Color::RGB(c.r, c.g, c.b); }

// One grid row as runs of equally styled cells
Element gridRow(const GridRow& row) {
    Elements runs;
    size_t i = 0;
    while (i < row.size()) {
        size_t j = i;
        std::string glyphs;
        while (j < row.size() && row[j].sameStyle(row[i]))
            glyphs += row[j++].glyph;

        auto run = text(glyphs);
        if (row[i].fg)   run = run | color(toColor(*row[i].fg));
        if (row[i].bg)   run = run | bgcolor(toColor(*row[i].bg));
        if (row[i].bold) run = run | bold;
        runs.push_back(run);
        i = j;
    }
    return hbox(std::move(runs));
}

Element legendPanel(const ChartFrame& frame) {
    Elements lines;
    lines.push_back(text(" " + frame.legendTitle) | bold);
    for (auto& e : frame.legend) {
        std::string value = frame.metric == Metric::Usage
            ? "In: " + formatTokens(e.inputTokens) + "  Out: " + formatTokens(e.outputTokens)
            : formatLegendCost(e.total);
        lines.push_back(hbox({
            text(" ■ ") | color(toColor(e.color)),
            text(e.label) | flex,
            text(" " + value + " ") | dim,
        }));
    }
    return vbox(std::move(lines));
}

Element summaryColumn(const std::string& heading,
                      const std::vector<TextReport::Line>& lines,
                      const ColorPalette& palette)
{
    Elements rows;
    rows.push_back(text(heading) | bold | color(toColor(palette.primary)));
    for (auto& l : lines) {
        auto value = text(l.value) | bold;
        if (l.trend > 0)      value = value | color(toColor(palette.error));
        else if (l.trend < 0) value = value | color(toColor(palette.accent));
        rows.push_back(hbox({text(" " + l.label) | dim, value}));
    }
    return vbox(std::move(rows));
}

std::string maskedInput(const std::string& input) {
    size_t codePoints = 0;
    for (unsigned char c : input)
        if ((c & 0xC0) != 0x80) codePoints++;
    return std::string(codePoints, '*');
}

} // namespace

DashboardUI::DashboardUI(DashboardController& controller)
    : controller_(controller) {}

void DashboardUI::run() {
    auto screen = ScreenInteractive::Fullscreen();

    controller_.dispatcher().setNotify([&] {
        screen.PostEvent(Event::Custom);
    });

    auto renderer = Renderer([&] {
        controller_.drainOutcomes();

        const auto& nav   = controller_.nav();
        const auto palette = controller_.palette();
        const auto summary = controller_.summary();
        const auto term    = Terminal::Size();

        // ── Header ────────────────────────────────────────────────
        auto header = hbox({
            text(" SpendScope ") | bold | color(toColor(palette.primary)) | inverted,
            text(" "),
            text(providerLabel(nav.provider())) | color(toColor(palette.primary)),
            filler(),
            controller_.anyInFlight() ? text("Refreshing... ") | dim
                                      : text(""),
            text("Range: " + rangeLabel(nav.range()) + " "),
        });

        // ── Options bar ───────────────────────────────────────────
        auto optionCell = [&](OptionsColumn col, const std::string& value) {
            auto cell = hbox({
                text(" " + columnLabel(col) + ": ") | dim,
                text(value + " ") | bold,
            });
            if (nav.column() == col)
                cell = cell | bgcolor(toColor(palette.selectedBg))
                            | color(toColor(palette.selectedFg));
            return cell;
        };

        std::string groupValue = groupByLabel(nav.groupBy());
        if (nav.filter()) groupValue += " [" + *nav.filter() + "]";
        if (nav.groupByExpanded()) groupValue += " ▾";

        auto options = hbox({
            optionCell(OptionsColumn::Provider, providerLabel(nav.provider())),
            separator(),
            optionCell(OptionsColumn::Metric, metricLabel(nav.metric())),
            separator(),
            optionCell(OptionsColumn::GroupBy, groupValue),
            separator(),
            optionCell(OptionsColumn::Range, rangeLabel(nav.range())),
            filler(),
        }) | borderLight;

        // ── Summary ───────────────────────────────────────────────
        auto costLines  = TextReport::costLines(summary);
        auto usageLines = TextReport::usageLines(summary);
        int summaryRows = static_cast<int>(std::max(costLines.size(), usageLines.size())) + 1;

        auto summaryPanel = vbox({
            hbox({
                summaryColumn("Cost: " + summary.costScope, costLines, palette) | flex,
                separator(),
                summaryColumn("Usage: " + summary.usageScope, usageLines, palette) | flex,
            }),
            hbox({text(" Date Range: ") | dim, text(TextReport::dateRange(summary))}),
        }) | border;

        // ── Chart ─────────────────────────────────────────────────
        const bool expanded = nav.groupByExpanded();
        const int usedRows = 1 /*header*/ + 3 /*options*/ + (summaryRows + 3) +
                             1 /*footer*/ + 4 /*chart border, title, separator*/;
        const int chartHeight = term.dimy - usedRows;
        const int chartWidth  = term.dimx - 2 - (expanded ? kFilterListWidth : 0);

        ChartFrame frame = controller_.buildChartFrame(chartWidth, chartHeight);

        Element chartBody;
        if (frame.state == PanelState::Ready) {
            Elements rows;
            for (auto& row : ChartGrid::build(frame, palette, ChartGrid::Mode::Color))
                rows.push_back(gridRow(row));
            chartBody = hbox({
                vbox(std::move(rows)) | size(WIDTH, EQUAL, frame.chartWidth),
                legendPanel(frame) | size(WIDTH, EQUAL, ChartFrameBuilder::kLegendWidth),
            });
        } else {
            auto msg = text(frame.message);
            if (frame.state == PanelState::Error)
                msg = msg | color(toColor(palette.error));
            else
                msg = msg | dim;
            chartBody = msg | center;
        }

        auto chartPanel = vbox({
            text(" " + frame.title) | bold,
            separator(),
            chartBody | flex,
        }) | border | flex;

        Element body = chartPanel;
        if (expanded) {
            auto menu = controller_.filterMenu();
            Elements items;
            items.push_back(text(" Filter") | bold);
            items.push_back(separator());
            for (size_t i = 0; i < menu.size(); i++) {
                auto item = text(" " + menu[i]);
                if (i == nav.filterCursor())
                    item = item | bgcolor(toColor(palette.selectedBg))
                                | color(toColor(palette.selectedFg));
                items.push_back(item);
            }
            body = hbox({
                vbox(std::move(items)) | border | size(WIDTH, EQUAL, kFilterListWidth),
                chartPanel,
            }) | flex;
        }

        auto footer = hbox({
            text(" [←/→] column  [↑/↓] select  [Enter] filter  [h/l] scroll  "
                 "[d] values  [r] refresh  [q] quit ") | dim,
        });

        auto main = vbox({header, options, summaryPanel, body, footer});

        // ── Credential prompt ─────────────────────────────────────
        const auto& prompt = controller_.prompt();
        if (!prompt.active())
            return main;

        auto promptBox = vbox({
            text(" Enter " + providerLabel(*prompt.provider) + " Admin API key ") |
                bold | color(toColor(palette.primary)),
            separator(),
            hbox({
                text(" > ") | bold,
                text(maskedInput(prompt.input)),
                text("_") | blink,
                filler(),
            }),
            separator(),
            text(" [Enter] save  [↑/↓] switch provider  [Esc] quit ") | dim,
        }) | border | size(WIDTH, GREATER_THAN, 60) | clear_under | center;

        return dbox({main, promptBox});
    });

    auto component = CatchEvent(renderer, [&](Event event) {
        if (event == Event::Custom)
            return false;

        std::optional<KeyPress> key;
        if      (event == Event::ArrowLeft)  key = KeyPress::of(KeyPress::Key::Left);
        else if (event == Event::ArrowRight) key = KeyPress::of(KeyPress::Key::Right);
        else if (event == Event::ArrowUp)    key = KeyPress::of(KeyPress::Key::Up);
        else if (event == Event::ArrowDown)  key = KeyPress::of(KeyPress::Key::Down);
        else if (event == Event::Return)     key = KeyPress::of(KeyPress::Key::Enter);
        else if (event == Event::Escape)     key = KeyPress::of(KeyPress::Key::Escape);
        else if (event == Event::Backspace)  key = KeyPress::of(KeyPress::Key::Backspace);
        else if (event.is_character())       key = KeyPress::character(event.character());

        if (!key) return false;

        controller_.handleKey(*key);
        if (controller_.quitRequested()) {
            spdlog::info("Quit requested");
            screen.Exit();
        }
        return true;
    });

    screen.Loop(component);
    controller_.dispatcher().setNotify(nullptr);
}
