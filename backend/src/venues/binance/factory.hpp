#pragma once

#include "venues/venue_factory.hpp"
#include "venues/ws_agent.hpp"
#include "venues/binance/parser.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_binance_factory() {
    VenueFactory factory;
    factory.venue = Venue::Binance;
    factory.name = BinanceFrameParser::kName;
    factory.default_url = "wss://stream.binance.com:9443/stream";
    factory.make_agent = [](const std::string& agent_name, const WsAgentOptions& opts) -> std::unique_ptr<IAgent> {
        return std::make_unique<WsAgent<BinanceFrameParser>>(agent_name, opts);
    };
    factory.to_venue_symbol = [](const std::string& canonical) {
        return SymbolCodec::to_venue(Venue::Binance, canonical);
    };
    return factory;
}
