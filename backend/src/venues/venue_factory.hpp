#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "md/md_types.hpp"
#include "venues/agent.hpp"
#include "venues/ws_agent.hpp"

struct VenueFactory {
    Venue venue{Venue::Binance};
    std::string name;
    std::string default_url;
    std::function<std::unique_ptr<IAgent>(const std::string& agent_name, const WsAgentOptions& opts)> make_agent;
    std::function<std::string(const std::string& canonical)> to_venue_symbol;
};
