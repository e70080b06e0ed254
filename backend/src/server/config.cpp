#include "server/config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "server/pairs_config.hpp"
#include "server/venues_config.hpp"
#include "venues/venue_registry.hpp"
#include "ws/ws.hpp"

namespace {

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    const auto last = s.find_last_not_of(" \t\r");
    if (last == std::string::npos) return {};
    s.erase(last + 1);
    return s;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream is(s);
    while (std::getline(is, item, sep)) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// Upper bounds for numeric flags; larger values are rejected.
constexpr std::uint64_t kMaxDurationMs = 24ull * 60 * 60 * 1000;
constexpr std::uint64_t kMaxQueueCapacity = 1ull << 20;

std::optional<std::uint64_t> parse_unsigned(const std::string& s) {
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
    return v;
}

const std::vector<std::string>& default_universe(Venue venue) {
    switch (venue) {
        case Venue::Binance: return kBinancePairs;
        case Venue::Deribit: return kDeribitPairs;
        default: return kCanonicalPairs;
    }
}

std::variant<FeedSpec, ConfigError> parse_feed(const std::string& text) {
    const auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        return ConfigError{"feed '" + text + "' must look like venue:symbol[,symbol...] or venue:all"};
    }
    const auto venue = venue_from_name(text.substr(0, colon));
    if (!venue) return ConfigError{"unknown venue in feed '" + text + "'"};
    const VenueFactory* factory = VenueRegistry::instance().find(*venue);
    if (!factory) {
        return ConfigError{"venue '" + text.substr(0, colon) + "' has no streaming agent"};
    }

    FeedSpec spec;
    spec.venue = *venue;
    spec.text = text;
    const std::string selector = text.substr(colon + 1);
    if (selector == "all") {
        spec.all = true;
        for (const auto& pair : default_universe(*venue)) {
            spec.venue_symbols.push_back(factory->to_venue_symbol(pair));
        }
    } else {
        spec.venue_symbols = split(selector, ',');
        if (spec.venue_symbols.empty()) return ConfigError{"feed '" + text + "' names no symbols"};
    }
    return spec;
}

struct KindFlag {
    const char* flag;
    EventKind kind;
};

constexpr KindFlag kKindFlags[] = {
    {"--l2-diffs", EventKind::L2Diff},
    {"--l2-snapshots", EventKind::L2Snapshot},
    {"--book-ticker", EventKind::BookTicker},
    {"--ticker-24h", EventKind::Ticker24h},
    {"--ohlcv", EventKind::Ohlcv},
    {"--index-price", EventKind::IndexPrice},
    {"--mark-price", EventKind::MarkPrice},
    {"--funding-rate", EventKind::FundingRate},
    {"--open-interest", EventKind::OpenInterest},
    {"--onchain-transfers", EventKind::OnchainTransfer},
    {"--onchain-balances", EventKind::OnchainBalance},
    {"--top-dex-pools", EventKind::TopDexPool},
    {"--news-headlines", EventKind::NewsHeadline},
    {"--telemetry", EventKind::Telemetry},
};

struct GateEnv {
    const char* key;
    EventKind kind;
};

constexpr GateEnv kGateEnv[] = {
    {"XFEED_ENABLE_OPTIONS_CHAIN", EventKind::OptionsChain},
    {"XFEED_ENABLE_MEMPOOL", EventKind::Mempool},
    {"XFEED_ENABLE_BRIDGE_FLOWS", EventKind::BridgeFlow},
    {"XFEED_ENABLE_MEV_SIGNALS", EventKind::MevSignal},
};

} // namespace

bool is_truthy(const std::string& value) {
    std::string v = trim(value);
    for (auto& ch : v) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::optional<DecimalValue> parse_threshold(const std::string& text) {
    std::string s = trim(text);
    bool percent = false;
    if (!s.empty() && s.back() == '%') {
        percent = true;
        s.pop_back();
    }
    auto d = Decimal::parse(s);
    if (!d || d->is_negative() || d->is_zero()) return std::nullopt;
    DecimalValue v = d->value();
    if (percent) v /= 100;
    return v;
}

std::variant<AppConfig, ConfigError> parse_config(const std::vector<std::string>& args, const EnvLookup& env) {
    AppConfig cfg;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            const auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg.resize(eq);
            }
        }

        // Value of the current flag: "--x=v" or "--x v".
        auto take_value = [&]() -> std::optional<std::string> {
            if (inline_value) return inline_value;
            if (i + 1 < args.size()) return args[++i];
            return std::nullopt;
        };
        auto take_number = [&](const char* flag, std::uint64_t max) -> std::variant<std::uint64_t, ConfigError> {
            auto v = take_value();
            if (!v) return ConfigError{std::string(flag) + " needs a value"};
            auto n = parse_unsigned(*v);
            if (!n) return ConfigError{std::string(flag) + ": '" + *v + "' is not a non-negative integer"};
            if (*n > max) return ConfigError{std::string(flag) + ": '" + *v + "' exceeds " + std::to_string(max)};
            return *n;
        };
        auto take_ms = [&](const char* flag, std::chrono::milliseconds& out) -> std::optional<ConfigError> {
            auto r = take_number(flag, kMaxDurationMs);
            if (auto* e = std::get_if<ConfigError>(&r)) return *e;
            const auto n = std::get<std::uint64_t>(r);
            if (n == 0) return ConfigError{std::string(flag) + " must be positive"};
            out = std::chrono::milliseconds(static_cast<std::int64_t>(n));
            return std::nullopt;
        };

        if (arg == "--help" || arg == "-h") {
            cfg.show_help = true;
            return cfg;
        }
        if (arg == "--no-trades") {
            cfg.features.enable(EventKind::Trade, false);
            continue;
        }

        bool matched = false;
        for (const auto& kf : kKindFlags) {
            if (arg == kf.flag) {
                cfg.features.enable(kf.kind);
                matched = true;
                break;
            }
        }
        if (matched) continue;

        if (arg == "--spread-threshold") {
            auto v = take_value();
            if (!v) return ConfigError{"--spread-threshold needs a value"};
            auto t = parse_threshold(*v);
            if (!t) return ConfigError{"--spread-threshold: '" + *v + "' is not a positive fraction or percentage"};
            cfg.analytics.threshold = *t;
        } else if (arg == "--staleness-ms") {
            if (auto e = take_ms("--staleness-ms", cfg.analytics.staleness_window)) return *e;
        } else if (arg == "--debounce-ms") {
            auto r = take_number("--debounce-ms", kMaxDurationMs);
            if (auto* e = std::get_if<ConfigError>(&r)) return *e;
            cfg.analytics.debounce_interval = std::chrono::milliseconds(static_cast<std::int64_t>(std::get<std::uint64_t>(r)));
        } else if (arg == "--max-failures") {
            auto r = take_number("--max-failures", std::numeric_limits<unsigned>::max());
            if (auto* e = std::get_if<ConfigError>(&r)) return *e;
            cfg.supervisor.max_consecutive_failures = static_cast<unsigned>(std::get<std::uint64_t>(r));
        } else if (arg == "--connect-timeout-ms") {
            if (auto e = take_ms("--connect-timeout-ms", cfg.connect_timeout)) return *e;
        } else if (arg == "--stale-after-ms") {
            if (auto e = take_ms("--stale-after-ms", cfg.stale_after)) return *e;
        } else if (arg == "--queue-capacity") {
            auto r = take_number("--queue-capacity", kMaxQueueCapacity);
            if (auto* e = std::get_if<ConfigError>(&r)) return *e;
            const auto n = std::get<std::uint64_t>(r);
            if (n == 0) return ConfigError{"--queue-capacity must be positive"};
            cfg.sink_options.capacity = static_cast<std::size_t>(n);
        } else if (arg == "--block-timeout-ms") {
            auto r = take_number("--block-timeout-ms", kMaxDurationMs);
            if (auto* e = std::get_if<ConfigError>(&r)) return *e;
            cfg.sink_options.block_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(std::get<std::uint64_t>(r)));
        } else if (arg == "--output") {
            auto v = take_value();
            if (!v || v->empty()) return ConfigError{"--output needs a file path"};
            cfg.output_path = *v;
        } else if (arg == "--quiet") {
            cfg.stdout_sink = false;
        } else if (arg.rfind("-", 0) == 0) {
            return ConfigError{"unknown option '" + arg + "'"};
        } else {
            auto feed = parse_feed(arg);
            if (auto* e = std::get_if<ConfigError>(&feed)) return *e;
            cfg.feeds.push_back(std::get<FeedSpec>(std::move(feed)));
        }
    }

    // Environment
    for (const auto& g : kGateEnv) {
        if (auto v = env(g.key); v && is_truthy(*v)) cfg.features.enable(g.kind);
    }
    if (auto q = env("XFEED_BINANCE_QUOTES")) {
        auto quotes = split(*q, ',');
        if (quotes.empty()) return ConfigError{"XFEED_BINANCE_QUOTES is set but lists no quote assets"};
        cfg.binance_quotes = std::move(quotes);
    }
    for (const auto& vc : kVenueConfigs) {
        auto url = env(vc.url_env);
        if (!url || url->empty()) continue;
        try {
            (void)parse_ws_url(*url);
        } catch (const std::invalid_argument& e) {
            return ConfigError{vc.url_env + ": " + e.what()};
        }
        cfg.ws_urls[vc.venue] = *url;
    }

    if (cfg.feeds.empty()) return ConfigError{"no feeds given (e.g. binance:btcusdt coinbase:all)"};
    if (!cfg.features.any()) return ConfigError{"every event kind is disabled"};
    if (!cfg.stdout_sink && !cfg.output_path) return ConfigError{"--quiet without --output leaves no sink"};
    return cfg;
}

std::optional<std::string> process_env(const std::string& key) {
    const char* v = std::getenv(key.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

// Helper function to load .env file and set environment variables
void load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        std::string backend_path = "backend/" + filepath;
        file.open(backend_path);
        if (!file.is_open()) {
            return; // .env file not found, will use system env vars
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) continue;

        // Remove quotes if present
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                  (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
    }
}

std::string usage() {
    return
        "usage: xfeed [options] venue:symbol[,symbol...]|venue:all ...\n"
        "  venues: binance, coinbase, deribit\n"
        "\n"
        "event kinds (trades are on by default):\n"
        "  --no-trades --l2-diffs --l2-snapshots --book-ticker --ticker-24h --ohlcv\n"
        "  --index-price --mark-price --funding-rate --open-interest\n"
        "  --onchain-transfers --onchain-balances --top-dex-pools --news-headlines --telemetry\n"
        "\n"
        "analytics:\n"
        "  --spread-threshold <fraction|N%>   default 0.5%\n"
        "  --staleness-ms <ms>                default 5000\n"
        "  --debounce-ms <ms>                 default 1000\n"
        "\n"
        "supervisor:\n"
        "  --max-failures <n>                 default 10 (0 = retry forever)\n"
        "  --connect-timeout-ms <ms>          default 10000\n"
        "  --stale-after-ms <ms>              default 30000\n"
        "\n"
        "dispatch:\n"
        "  --queue-capacity <n>               default 4096 per sink\n"
        "  --block-timeout-ms <ms>            default 250\n"
        "\n"
        "output:\n"
        "  --output <file>                    append JSON lines to <file>\n"
        "  --quiet                            no stdout sink\n"
        "\n"
        "environment (.env is loaded first):\n"
        "  XFEED_ENABLE_OPTIONS_CHAIN, XFEED_ENABLE_MEMPOOL, XFEED_ENABLE_BRIDGE_FLOWS,\n"
        "  XFEED_ENABLE_MEV_SIGNALS   1|true|yes|on\n"
        "  XFEED_BINANCE_QUOTES       comma-separated quote assets for symbol splitting\n"
        "  XFEED_BINANCE_WS_URL, XFEED_COINBASE_WS_URL, XFEED_DERIBIT_WS_URL\n";
}
