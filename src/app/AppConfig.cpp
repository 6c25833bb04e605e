#include "app/AppConfig.hpp"
#include "data/GroupKey.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

std::string getEnv(const std::string& key, const std::string& defaultVal) {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

bool loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string line;
    while (std::getline(file, line)) {
        line = trimmed(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trimmed(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trimmed(line.substr(0, eq));
        std::string val = trimmed(line.substr(eq + 1));
        // Remove quotes
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') ||
             (val.front() == '\'' && val.back() == '\'')))
            val = val.substr(1, val.size() - 2);
        if (key.empty()) continue;
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
    return true;
}

AppConfig AppConfig::applyJson(AppConfig base, const nlohmann::json& j) {
    if (!j.is_object())
        throw std::invalid_argument("config root must be a JSON object");

    try {
        base.lookbackDays            = j.value("lookback_days", base.lookbackDays);
        base.client.timeoutMs        = j.value("http_timeout_ms", base.client.timeoutMs);
        base.client.openaiBaseUrl    = j.value("openai_base_url", base.client.openaiBaseUrl);
        base.client.anthropicBaseUrl = j.value("anthropic_base_url", base.client.anthropicBaseUrl);
        base.layout.outlierThreshold = j.value("smart_scale_threshold", base.layout.outlierThreshold);
        base.layout.outlierCap       = j.value("smart_scale_cap", base.layout.outlierCap);
        base.layout.minBarWidth      = j.value("min_bar_width", base.layout.minBarWidth);
        base.layout.maxBarWidth      = j.value("max_bar_width", base.layout.maxBarWidth);
        base.layout.barSpacing       = j.value("bar_spacing", base.layout.barSpacing);
        base.logFile                 = j.value("log_file", base.logFile);
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("config value has the wrong type: ") + e.what());
    }

    if (base.lookbackDays < 1)
        throw std::invalid_argument("lookback_days must be at least 1");
    if (base.client.timeoutMs < 1)
        throw std::invalid_argument("http_timeout_ms must be positive");
    return base;
}

AppConfig AppConfig::fromArgs(int argc, char* argv[]) {
    AppConfig cfg;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](const std::string& flag) {
            if (i + 1 >= argc)
                throw std::invalid_argument(flag + " needs a value");
            return std::string(argv[++i]);
        };

        if (arg == "--env-file" || arg == "-e")    cfg.envFile = next(arg);
        else if (arg == "--config" || arg == "-c") cfg.configPath = next(arg);
        else if (arg == "--print" || arg == "-p")  cfg.printMode = true;
        else if (arg == "--help" || arg == "-h")   cfg.showHelp = true;
        else throw std::invalid_argument("unknown argument: " + arg);
    }
    return cfg;
}

AppConfig AppConfig::load(int argc, char* argv[]) {
    AppConfig cfg = fromArgs(argc, argv);
    if (cfg.showHelp) return cfg;

    if (!loadDotEnv(cfg.envFile) && cfg.envFile != ".env")
        spdlog::warn("Cannot open env file: {}", cfg.envFile);

    cfg.logLevel = getEnv("SPENDSCOPE_LOG_LEVEL", cfg.logLevel);

    auto keyFromEnv = [](const char* name) -> std::optional<std::string> {
        auto v = trimmed(getEnv(name));
        if (v.empty()) return std::nullopt;
        return v;
    };
    cfg.openaiKey    = keyFromEnv("OPENAI_ADMIN_KEY");
    cfg.anthropicKey = keyFromEnv("ANTHROPIC_ADMIN_KEY");

    std::ifstream f(cfg.configPath);
    if (!f.is_open()) {
        spdlog::debug("No config file at {}, using defaults", cfg.configPath);
        return cfg;
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Cannot parse config file " + cfg.configPath +
                                    ": " + e.what());
    }
    return applyJson(std::move(cfg), j);
}

std::string AppConfig::usage() {
    return
        "Usage: spendscope [options]\n"
        "  -e, --env-file <path>   load KEY=VALUE pairs (default .env)\n"
        "  -c, --config <path>     JSON config (default config/spendscope.json)\n"
        "  -p, --print             fetch once and print a text report\n"
        "  -h, --help              show this help\n"
        "\n"
        "Environment: OPENAI_ADMIN_KEY, ANTHROPIC_ADMIN_KEY, SPENDSCOPE_LOG_LEVEL\n";
}
