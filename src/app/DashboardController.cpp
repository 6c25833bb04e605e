#include "app/DashboardController.hpp"
#include "chart/ColorAssigner.hpp"
#include "chart/Format.hpp"
#include "data/GroupKey.hpp"
#include <spdlog/spdlog.h>

DashboardController::DashboardController(const LayoutConfig& layout,
                                         FetchDispatcher::Job job)
    : sessions_{{ProviderSession(Provider::OpenAI), ProviderSession(Provider::Anthropic)}}
    , engine_(layout)
    , dispatcher_(std::make_unique<FetchDispatcher>(std::move(job))) {}

void DashboardController::setCredentials(Provider provider, const std::string& apiKey) {
    mutableSession(provider).setCredentials(apiKey);
    spdlog::info("{}: admin key configured", providerLabel(provider));
}

void DashboardController::start() {
    nav_.ensureSelectionHasCredentials(navContext());

    if (!activeSession().hasCredentials())
        openPrompt(nav_.provider());
    else
        requestRefresh(nav_.provider());
}

bool DashboardController::anyInFlight() const {
    for (auto& s : sessions_)
        if (s.inFlight()) return true;
    return false;
}

NavContext DashboardController::navContext() const {
    NavContext ctx;
    for (auto p : kAllProviders) {
        ctx.hasCredentials[providerIndex(p)] = session(p).hasCredentials();
        ctx.fetched[providerIndex(p)]        = session(p).fetched();
    }
    ctx.filters = currentFilters();
    return ctx;
}

std::vector<std::string> DashboardController::currentFilters() const {
    return activeSession().store().availableFilters(nav_.metric(), nav_.groupBy(),
                                                    nav_.range());
}

std::vector<std::string> DashboardController::filterMenu() const {
    return NavigationState::filterMenu(currentFilters());
}

// ── Commands ──────────────────────────────────────────────────────

bool DashboardController::requestRefresh(Provider provider) {
    auto& s = mutableSession(provider);
    if (!s.hasCredentials()) {
        spdlog::debug("{}: refresh ignored, no credentials", providerLabel(provider));
        return false;
    }
    if (!s.beginFetch())
        return false;

    spdlog::info("{}: refresh requested", providerLabel(provider));
    dispatcher_->submit(*s.credentials());
    return true;
}

size_t DashboardController::drainOutcomes() {
    auto outcomes = dispatcher_->drain();
    for (auto& o : outcomes) {
        auto provider = o.provider;
        mutableSession(provider).apply(std::move(o));
    }
    if (!outcomes.empty())
        nav_.reconcileFilter(currentFilters());
    return outcomes.size();
}

// ── Input ─────────────────────────────────────────────────────────

void DashboardController::handleKey(const KeyPress& key) {
    using K = KeyPress::Key;

    // Arrow keys navigate even while the prompt is open
    if (prompt_.active() && key.key != K::Left && key.key != K::Right &&
        key.key != K::Up && key.key != K::Down) {
        handlePromptKey(key);
        return;
    }
    handleNavKey(key);
}

void DashboardController::handlePromptKey(const KeyPress& key) {
    switch (key.key) {
        case KeyPress::Key::Enter:
            submitPrompt();
            break;
        case KeyPress::Key::Escape:
            requestQuit();
            break;
        case KeyPress::Key::Backspace:
            // Drop one UTF-8 code point
            while (!prompt_.input.empty()) {
                unsigned char c = static_cast<unsigned char>(prompt_.input.back());
                prompt_.input.pop_back();
                if ((c & 0xC0) != 0x80) break;
            }
            break;
        case KeyPress::Key::Character:
            prompt_.input += key.text;
            break;
        default:
            break;
    }
}

void DashboardController::handleNavKey(const KeyPress& key) {
    using K = KeyPress::Key;

    switch (key.key) {
        case K::Left:
        case K::Right:
            nav_.moveColumn(key.key == K::Left ? -1 : 1);
            return;

        case K::Up:
        case K::Down: {
            Provider before = nav_.provider();
            NavEffect effect = nav_.moveCursor(key.key == K::Up ? -1 : 1, navContext());
            if (nav_.provider() != before) {
                if (effect == NavEffect::CredentialsNeeded) {
                    openPrompt(nav_.provider());
                } else {
                    closePrompt();
                    if (effect == NavEffect::FetchNeeded)
                        requestRefresh(nav_.provider());
                }
            }
            nav_.reconcileFilter(currentFilters());
            return;
        }

        case K::Enter:
            nav_.toggleGroupByExpansion();
            return;

        case K::Character:
            break;

        default:
            return;
    }

    if (key.text.size() != 1) return;
    switch (key.text[0]) {
        case 'h': case 'H': scroll(-1); break;
        case 'l': case 'L': scroll(1);  break;
        case 'd': case 'D': showSegmentValues_ = !showSegmentValues_; break;
        case 'r': case 'R': requestRefresh(nav_.provider()); break;
        case 'q': case 'Q': requestQuit(); break;
        default: break;
    }
}

void DashboardController::openPrompt(Provider provider) {
    prompt_.provider = provider;
    prompt_.input.clear();
}

void DashboardController::closePrompt() {
    prompt_.provider.reset();
    prompt_.input.clear();
}

void DashboardController::submitPrompt() {
    if (!prompt_.provider) return;

    auto key = trimmed(prompt_.input);
    if (key.empty()) return;

    Provider provider = *prompt_.provider;
    setCredentials(provider, key);
    closePrompt();

    nav_.ensureSelectionHasCredentials(navContext());
    requestRefresh(nav_.provider());
}

void DashboardController::scroll(int delta) {
    if (lastVisible_ == 0) return;

    auto& s = mutableSession(nav_.provider());
    Metric m = nav_.metric();
    s.setScrollOffset(m, ChartLayoutEngine::scroll(s.scrollOffset(m), delta,
                                                   lastTotalBars_, lastVisible_));
}

// ── Per-frame views ───────────────────────────────────────────────

ViewSelection DashboardController::currentView() const {
    ViewSelection v;
    v.provider     = nav_.provider();
    v.metric       = nav_.metric();
    v.groupBy      = nav_.groupBy();
    v.range        = nav_.range();
    v.filter       = nav_.filter();
    v.scrollOffset = activeSession().scrollOffset(nav_.metric());
    return v;
}

ChartFrame DashboardController::frameFor(const ViewSelection& view,
                                         int width, int height) const
{
    const ProviderSession& s = session(view.provider);
    const TimeSeriesStore& store = s.store();

    SeriesSnapshot series = view.metric == Metric::Cost
        ? store.costSeries(view.range, view.filter)
        : store.usageSeries(view.range, view.groupBy, view.filter);

    ColorTable colors = ColorAssigner(ColorPalette::forProvider(view.provider).chartColors)
                            .assign(store.colorCategories(view.groupBy));

    ChartRequest req;
    req.provider          = view.provider;
    req.metric            = view.metric;
    req.groupBy           = view.groupBy;
    req.filter            = view.filter;
    req.hasCredentials    = s.hasCredentials();
    req.inFlight          = s.inFlight();
    req.error             = s.error(view.metric);
    req.series            = &series;
    req.colors            = &colors;
    req.keyNames          = &s.keyNames();
    req.width             = width;
    req.height            = height;
    req.scrollOffset      = view.scrollOffset;
    req.showSegmentValues = showSegmentValues_;

    return ChartFrameBuilder(engine_).build(req);
}

ChartFrame DashboardController::buildChartFrame(int width, int height) {
    ChartFrame frame = frameFor(currentView(), width, height);

    if (frame.layout) {
        lastTotalBars_ = frame.totalBars;
        lastVisible_   = frame.layout->visibleCount;
        mutableSession(nav_.provider()).setScrollOffset(nav_.metric(),
                                                        frame.layout->startIndex);
    } else {
        lastTotalBars_ = 0;
        lastVisible_   = 0;
    }
    return frame;
}

DashboardSummary DashboardController::summaryFor(const ViewSelection& view) const {
    const ProviderSession& s = session(view.provider);
    const auto& store = s.store();

    DashboardSummary out;
    out.provider = view.provider;
    out.range    = view.range;
    out.hasData  = store.hasAnyRecords();

    // The filter narrows only the column of the metric on screen
    std::optional<std::string> costFilter, usageFilter;
    if (view.metric == Metric::Cost) costFilter = view.filter;
    else                             usageFilter = view.filter;

    if (costFilter) out.costScope = *costFilter;
    if (usageFilter) {
        out.usageScope = *usageFilter;
        if (view.groupBy == GroupBy::ApiKeys) {
            auto it = s.keyNames().find(*usageFilter);
            out.usageScope = it != s.keyNames().end() ? it->second
                                                      : abbreviateApiKey(*usageFilter);
        }
    }

    out.cost  = SummaryCalculator::summarizeCost(store.costRecords(), view.range, costFilter);
    out.usage = SummaryCalculator::summarizeUsage(store.usageRecords(), view.range,
                                                  view.groupBy, usageFilter);
    return out;
}

DashboardSummary DashboardController::summary() const {
    return summaryFor(currentView());
}
