#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "md/md_types.hpp"
#include "util/log.hpp"
#include "venues/agent.hpp"
#include "venues/frame_parser.hpp"
#include "ws/ws.hpp"

struct WsAgentOptions {
    std::string url;                         // wss://...
    std::vector<std::string> venue_symbols;  // already in venue format
    FeatureSet features;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds stale_after{30000};
};

// WsAgent is parameterized by the concrete frame parser of its venue.
// Each WsAgent owns:
//  - one TLS websocket session (connected in connect(), released in close())
//  - a parser that turns frames into venue-tagged RawEvents
template <typename ParserT>
class WsAgent final : public IAgent {
    static_assert(is_frame_parser_v<ParserT>, "ParserT must provide kName, kVenue, kUserAgent, subscribe_messages and parse");

public:
    WsAgent(std::string name, WsAgentOptions opts)
    : name_(std::move(name))
    , opts_(std::move(opts))
    , session_(parse_ws_url(opts_.url), ParserT::kUserAgent)
    , parser_(opts_.features) {}

    const std::string& name() const override { return name_; }
    Venue venue() const override { return ParserT::kVenue; }

    void connect(const StopSignal& stop) override {
        session_.connect(opts_.connect_timeout, stop);
        const auto subs = parser_.subscribe_messages(opts_.venue_symbols);
        for (const auto& msg : subs) {
            session_.write(msg, opts_.connect_timeout, stop);
        }
        log_line(tag_.c_str(), name_, ": connected to ", session_.endpoint().host, ", ",
                 opts_.venue_symbols.size(), " symbols, ", subs.size(), " subscribe frame(s)");
    }

    bool next(std::vector<RawEvent>& out, const StopSignal& stop) override {
        if (!session_.read(frame_, opts_.stale_after, stop)) return false;
        parser_.parse(frame_, wall_clock_ms(), out);
        return true;
    }

    void close() noexcept override { session_.close(); }

private:
    std::string name_;
    std::string tag_{std::string(ParserT::kName) + "-ws"};
    WsAgentOptions opts_;
    WsSession session_;
    ParserT parser_;
    std::string frame_;
};
