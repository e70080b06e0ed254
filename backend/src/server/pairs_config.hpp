#pragma once

#include <string>
#include <vector>

// Default universe: what a feed spec of `venue:all` subscribes to.
inline const std::vector<std::string> kCanonicalPairs = {
    "BTC-USD",
    "ETH-USD",
    "SOL-USD",
};

// Binance lists USD pairs against USDT.
inline const std::vector<std::string> kBinancePairs = {
    "BTC-USDT",
    "ETH-USDT",
    "SOL-USDT",
};

// Deribit has no inverse SOL perpetual; SOL settles in USDC.
inline const std::vector<std::string> kDeribitPairs = {
    "BTC-USD",
    "ETH-USD",
    "SOL-USDC",
};
