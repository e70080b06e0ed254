#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "analytics/spread_detector.hpp"
#include "md/md_types.hpp"
#include "pipeline/dispatcher.hpp"
#include "pipeline/supervisor.hpp"

// venue + symbols, from "binance:btcusdt,ethusdt" or "coinbase:all"
struct FeedSpec {
    Venue venue{Venue::Binance};
    std::vector<std::string> venue_symbols; // `all` already resolved to the default universe
    bool all{false};
    std::string text;                       // as given on the command line
};

// Everything the process needs, resolved once at startup.
struct AppConfig {
    std::vector<FeedSpec> feeds;
    FeatureSet features = FeatureSet::defaults();

    SpreadDetectorOptions analytics;
    SupervisorOptions supervisor;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds stale_after{30000};
    ConsumerOptions sink_options;

    bool stdout_sink{true};
    std::optional<std::string> output_path;

    std::optional<std::vector<std::string>> binance_quotes; // XFEED_BINANCE_QUOTES
    std::map<Venue, std::string> ws_urls;                   // endpoint overrides

    bool show_help{false};
};

struct ConfigError {
    std::string message;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& key)>;

// Parses argv (without the program name) and the environment.
// With --help the result has show_help set and feeds may be empty.
std::variant<AppConfig, ConfigError> parse_config(const std::vector<std::string>& args, const EnvLookup& env);

// std::getenv
std::optional<std::string> process_env(const std::string& key);

// Loads KEY=VALUE lines into the process environment without overriding
// variables that are already set. A missing file is not an error.
void load_env_file(const std::string& filepath = ".env");

// "1", "true", "yes", "on" (any case)
bool is_truthy(const std::string& value);

// "0.005" or "0.5%" -> 0.005. nullopt unless strictly positive.
std::optional<DecimalValue> parse_threshold(const std::string& text);

std::string usage();
