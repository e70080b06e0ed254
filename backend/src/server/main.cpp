#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "md/canonicalizer.hpp"
#include "pipeline/pipeline.hpp"
#include "server/config.hpp"
#include "sinks/line_sink.hpp"
#include "util/log.hpp"
#include "venues/venue_registry.hpp"

namespace {

constexpr std::chrono::seconds kStatusInterval{30};

std::vector<AgentSpec> build_agents(const AppConfig& cfg) {
    const auto& registry = VenueRegistry::instance();
    std::vector<AgentSpec> agents;
    agents.reserve(cfg.feeds.size());

    for (const auto& feed : cfg.feeds) {
        WsAgentOptions opts;
        if (auto url = cfg.ws_urls.find(feed.venue); url != cfg.ws_urls.end()) opts.url = url->second;
        opts.venue_symbols = feed.venue_symbols;
        opts.features = cfg.features;
        opts.connect_timeout = cfg.connect_timeout;
        opts.stale_after = cfg.stale_after;

        // parse_config only accepts venues with a streaming agent
        agents.push_back(AgentSpec{feed.text, registry.agent_factory(feed.text, feed.venue, std::move(opts))});
    }
    return agents;
}

Canonicalizer make_canonicalizer(const AppConfig& cfg) {
    SymbolCodec codec;
    if (cfg.binance_quotes) codec.set_quotes(Venue::Binance, *cfg.binance_quotes);
    return Canonicalizer(cfg.features, std::move(codec));
}

void log_status(const Pipeline& pipeline) {
    for (const auto& line : pipeline.status_lines()) log_line("status", line);
}

} // namespace

int main(int argc, char** argv) {
    // Load .env file
    load_env_file();

    const std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_config(args, process_env);
    if (auto* err = std::get_if<ConfigError>(&parsed)) {
        log_line("config", err->message);
        std::cerr << usage();
        return 2;
    }
    const AppConfig cfg = std::get<AppConfig>(std::move(parsed));
    if (cfg.show_help) {
        std::cout << usage();
        return 0;
    }

    // SIGINT/SIGTERM are queued from here on and handled once ioc runs
    boost::asio::io_context ioc{1};
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);

    std::vector<std::shared_ptr<ISink>> sinks;
    if (cfg.stdout_sink) sinks.push_back(std::make_shared<StdoutSink>());
    if (cfg.output_path) {
        try {
            sinks.push_back(std::make_shared<FileSink>(*cfg.output_path));
        } catch (const std::exception& e) {
            log_line("config", e.what());
            return 2;
        }
    }

    PipelineOptions popts;
    popts.supervisor = cfg.supervisor;
    popts.analytics = cfg.analytics;
    popts.sinks = cfg.sink_options;

    Pipeline pipeline(make_canonicalizer(cfg), build_agents(cfg), std::move(sinks), popts);

    for (const auto& feed : cfg.feeds) {
        std::string symbols;
        for (const auto& s : feed.venue_symbols) symbols += (symbols.empty() ? "" : ",") + s;
        log_line("setup", "feed ", venue_name(feed.venue), " [", symbols, "]");
    }

    pipeline.start();

    boost::asio::steady_timer status_timer(ioc);

    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        log_line("main", "signal ", signo, " received; shutting down");
        status_timer.cancel();
        ioc.stop();
    });

    std::function<void()> arm_status = [&] {
        status_timer.expires_after(kStatusInterval);
        status_timer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            log_status(pipeline);
            arm_status();
        });
    };
    arm_status();

    ioc.run();

    pipeline.stop();
    log_status(pipeline);
    return 0;
}
