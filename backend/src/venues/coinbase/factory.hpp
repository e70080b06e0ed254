#pragma once

#include "venues/venue_factory.hpp"
#include "venues/ws_agent.hpp"
#include "venues/coinbase/parser.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_coinbase_factory() {
    VenueFactory factory;
    factory.venue = Venue::Coinbase;
    factory.name = CoinbaseFrameParser::kName;
    factory.default_url = "wss://ws-feed.exchange.coinbase.com";
    factory.make_agent = [](const std::string& agent_name, const WsAgentOptions& opts) -> std::unique_ptr<IAgent> {
        return std::make_unique<WsAgent<CoinbaseFrameParser>>(agent_name, opts);
    };
    factory.to_venue_symbol = [](const std::string& canonical) {
        return SymbolCodec::to_venue(Venue::Coinbase, canonical);
    };
    return factory;
}
