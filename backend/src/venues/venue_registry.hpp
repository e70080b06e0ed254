#pragma once

#include <array>
#include <optional>
#include <stdexcept>
#include <string>

#include "venue_factory.hpp"
#include "binance/factory.hpp"
#include "coinbase/factory.hpp"
#include "deribit/factory.hpp"

// Closed set of streaming venues compiled into the binary, indexed by Venue.
// Onchain has no slot: its events come from outside the agent layer.
class VenueRegistry {
public:
    static const VenueRegistry& instance() {
        static VenueRegistry registry;
        return registry;
    }

    const VenueFactory* find(Venue venue) const {
        const auto& slot = slots_[static_cast<std::size_t>(venue)];
        return slot ? &*slot : nullptr;
    }

    // Factory the supervisor calls for every (re)connect. `opts.url` empty
    // means the venue's default endpoint. Throws std::invalid_argument for a
    // venue without an agent.
    AgentFactory agent_factory(const std::string& agent_name, Venue venue, WsAgentOptions opts) const {
        const VenueFactory* factory = find(venue);
        if (!factory) {
            throw std::invalid_argument(std::string("no streaming agent for venue ") + venue_name(venue));
        }
        if (opts.url.empty()) opts.url = factory->default_url;
        return [factory, agent_name, opts] { return factory->make_agent(agent_name, opts); };
    }

private:
    VenueRegistry() {
        add(make_binance_factory());
        add(make_coinbase_factory());
        add(make_deribit_factory());
    }

    void add(VenueFactory factory) {
        if (factory.name.empty() || !factory.make_agent || !factory.to_venue_symbol) return;
        slots_[static_cast<std::size_t>(factory.venue)] = std::move(factory);
    }

    std::array<std::optional<VenueFactory>, kVenueCount> slots_;
};
