#include "app/AppConfig.hpp"
#include "app/DashboardController.hpp"
#include "fetch/FetchAggregator.hpp"
#include "ui/DashboardUI.hpp"
#include "ui/TextReport.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

constexpr int kPrintWidth  = 120;
constexpr int kPrintHeight = 16;

// The TUI owns the terminal, so interactive runs log to the file only
void setupLogging(const AppConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.logFile, 1048576 * 5, 3));  // 5MB, 3 files
    if (config.printMode)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    auto logger = std::make_shared<spdlog::logger>("spendscope", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (config.logLevel == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (config.logLevel == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (config.logLevel == "error") spdlog::set_level(spdlog::level::err);
    else                                 spdlog::set_level(spdlog::level::info);
}

int runPrintMode(DashboardController& controller) {
    bool anyCredentials = false;
    for (auto p : kAllProviders) {
        if (controller.session(p).hasCredentials()) {
            anyCredentials = true;
            controller.requestRefresh(p);
        }
    }

    if (!anyCredentials) {
        std::cerr << "No admin key configured. Set OPENAI_ADMIN_KEY or "
                     "ANTHROPIC_ADMIN_KEY.\n";
        return 1;
    }

    controller.dispatcher().waitIdle();
    controller.drainOutcomes();

    bool anySucceeded = false;
    for (auto p : kAllProviders) {
        const auto& s = controller.session(p);
        if (!s.hasCredentials()) continue;

        ViewSelection view;
        view.provider = p;
        view.range    = controller.nav().range();

        view.metric = Metric::Cost;
        auto cost = controller.frameFor(view, kPrintWidth, kPrintHeight);
        view.metric = Metric::Usage;
        auto usage = controller.frameFor(view, kPrintWidth, kPrintHeight);

        std::cout << TextReport::renderProvider(controller.summaryFor(view), cost, usage)
                  << "\n";

        if (!s.error(Metric::Cost) || !s.error(Metric::Usage))
            anySucceeded = true;
    }
    return anySucceeded ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = AppConfig::load(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "spendscope: " << e.what() << "\n\n" << AppConfig::usage();
        return 1;
    }

    if (config.showHelp) {
        std::cout << AppConfig::usage();
        return 0;
    }

    setupLogging(config);
    spdlog::info("SpendScope v0.1.0 starting");

    // Shared with the fetch threads, which may outlive the UI on quit
    auto aggregator = std::make_shared<FetchAggregator>(
        [client = config.client](const ProviderCredentials& creds) {
            return makeProviderClient(creds, client);
        },
        config.lookbackDays);

    DashboardController controller(config.layout, [aggregator](const ProviderCredentials& c) {
        return aggregator->run(c);
    });

    if (config.openaiKey)    controller.setCredentials(Provider::OpenAI, *config.openaiKey);
    if (config.anthropicKey) controller.setCredentials(Provider::Anthropic, *config.anthropicKey);

    int rc = 0;
    if (config.printMode) {
        rc = runPrintMode(controller);
    } else {
        controller.start();
        DashboardUI ui(controller);
        ui.run();
    }

    spdlog::info("SpendScope exited cleanly");
    return rc;
}
