#pragma once

#include "venues/venue_factory.hpp"
#include "venues/ws_agent.hpp"
#include "venues/deribit/parser.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_deribit_factory() {
    VenueFactory factory;
    factory.venue = Venue::Deribit;
    factory.name = DeribitFrameParser::kName;
    factory.default_url = "wss://www.deribit.com/ws/api/v2";
    factory.make_agent = [](const std::string& agent_name, const WsAgentOptions& opts) -> std::unique_ptr<IAgent> {
        return std::make_unique<WsAgent<DeribitFrameParser>>(agent_name, opts);
    };
    factory.to_venue_symbol = [](const std::string& canonical) {
        return SymbolCodec::to_venue(Venue::Deribit, canonical);
    };
    return factory;
}
