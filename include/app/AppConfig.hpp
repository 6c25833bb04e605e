#pragma once
#include "api/ProviderClient.hpp"
#include "chart/ChartLayoutEngine.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Runtime configuration: command line, .env, environment and the optional
// JSON config file, in that order of precedence for the values they share.
struct AppConfig {
    std::string envFile    = ".env";
    std::string configPath = "config/spendscope.json";
    bool        printMode  = false;
    bool        showHelp   = false;

    std::string logLevel = "info";
    std::string logFile  = "spendscope.log";

    int lookbackDays = 30;
    ClientConfig client;
    LayoutConfig layout;

    std::optional<std::string> openaiKey;
    std::optional<std::string> anthropicKey;

    // Overlays keys present in `j` onto `base`
    static AppConfig applyJson(AppConfig base, const nlohmann::json& j);

    // Reads `--env-file`, `--config`, `--print`, `--help`.
    // Throws std::invalid_argument on unknown or incomplete flags.
    static AppConfig fromArgs(int argc, char* argv[]);

    // Full load: args, then .env, then environment, then config file.
    // A missing config file is fine; a malformed one throws.
    static AppConfig load(int argc, char* argv[]);

    static std::string usage();
};

std::string getEnv(const std::string& key, const std::string& defaultVal = "");

// KEY=VALUE lines; existing environment variables win. False when the
// file cannot be opened.
bool loadDotEnv(const std::string& path);
