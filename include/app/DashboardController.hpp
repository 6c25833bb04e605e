#pragma once
#include "chart/ChartFrame.hpp"
#include "chart/Palette.hpp"
#include "data/SummaryCalculator.hpp"
#include "fetch/FetchDispatcher.hpp"
#include "fetch/ProviderSession.hpp"
#include "nav/NavigationState.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>

// Keyboard input as the controller sees it; the UI maps terminal events
// onto these.
struct KeyPress {
    enum class Key {
        Left, Right, Up, Down,
        Enter, Escape, Backspace,
        Character
    };

    Key         key = Key::Character;
    std::string text;   // UTF-8 for Key::Character

    static KeyPress of(Key k) { return {k, {}}; }
    static KeyPress character(std::string c) { return {Key::Character, std::move(c)}; }
};

// Admin key entry for a provider that has none
struct CredentialPrompt {
    std::optional<Provider> provider;   // set while the prompt is open
    std::string input;

    bool active() const { return provider.has_value(); }
};

struct DashboardSummary {
    Provider     provider = Provider::OpenAI;
    Range        range    = Range::SevenDays;
    CostSummary  cost;
    UsageSummary usage;
    std::string  costScope  = "All";   // filter shown in each column header
    std::string  usageScope = "All";
    bool         hasData  = false;
};

// Which chart to build, independent of the navigation state
struct ViewSelection {
    Provider provider = Provider::OpenAI;
    Metric   metric   = Metric::Cost;
    GroupBy  groupBy  = GroupBy::Model;
    Range    range    = Range::SevenDays;
    std::optional<std::string> filter;
    size_t   scrollOffset = kScrollToEnd;
};

// Single owner of the dashboard state. The UI thread feeds it key presses
// and drains fetch outcomes; every mutation happens through this class.
class DashboardController {
public:
    DashboardController(const LayoutConfig& layout, FetchDispatcher::Job job);

    // Startup credentials (environment). Does not fetch.
    void setCredentials(Provider provider, const std::string& apiKey);

    // Picks a provider with credentials, opens the prompt when there is
    // none, and starts the first fetch.
    void start();

    void handleKey(const KeyPress& key);

    // ── Commands ──────────────────────────────────────────────────
    // False when the provider has no key or a fetch is already running
    bool requestRefresh(Provider provider);
    void requestQuit() { quit_ = true; }
    bool quitRequested() const { return quit_; }

    // Applies finished fetches to their sessions; returns how many
    size_t drainOutcomes();

    // ── Per-frame views ───────────────────────────────────────────
    // Records the clamped scroll position so h/l continue from what is
    // on screen
    ChartFrame buildChartFrame(int width, int height);
    DashboardSummary summary() const;

    // Same views for an explicit selection (print mode)
    ChartFrame frameFor(const ViewSelection& view, int width, int height) const;
    DashboardSummary summaryFor(const ViewSelection& view) const;
    ViewSelection currentView() const;

    const NavigationState& nav() const { return nav_; }
    const CredentialPrompt& prompt() const { return prompt_; }
    const ProviderSession& session(Provider p) const { return sessions_[providerIndex(p)]; }
    const ProviderSession& activeSession() const { return session(nav_.provider()); }
    ColorPalette palette() const { return ColorPalette::forProvider(nav_.provider()); }

    bool showSegmentValues() const { return showSegmentValues_; }
    bool anyInFlight() const;

    // Filter list for the current selection ("All" first)
    std::vector<std::string> filterMenu() const;

    FetchDispatcher& dispatcher() { return *dispatcher_; }

private:
    std::array<ProviderSession, 2> sessions_;
    NavigationState   nav_;
    CredentialPrompt  prompt_;
    ChartLayoutEngine engine_;
    std::unique_ptr<FetchDispatcher> dispatcher_;

    bool showSegmentValues_ = false;
    bool quit_ = false;

    // Geometry of the last built frame, for scrolling
    size_t lastTotalBars_ = 0;
    size_t lastVisible_   = 0;

    ProviderSession& mutableSession(Provider p) { return sessions_[providerIndex(p)]; }

    NavContext navContext() const;
    std::vector<std::string> currentFilters() const;

    void openPrompt(Provider provider);
    void closePrompt();
    void submitPrompt();
    void handlePromptKey(const KeyPress& key);
    void handleNavKey(const KeyPress& key);
    void scroll(int delta);
};
