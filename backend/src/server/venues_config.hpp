#pragma once

#include <string>
#include <vector>

#include "md/md_types.hpp"

struct VenueConfig {
    Venue venue;
    std::string url_env; // endpoint override
};

inline const std::vector<VenueConfig> kVenueConfigs = {
    {Venue::Binance, "XFEED_BINANCE_WS_URL"},
    {Venue::Coinbase, "XFEED_COINBASE_WS_URL"},
    {Venue::Deribit, "XFEED_DERIBIT_WS_URL"},
};
