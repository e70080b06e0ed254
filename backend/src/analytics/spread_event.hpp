#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "md/decimal.hpp"

// Cross-venue price dislocation for one symbol.
struct SpreadEvent {
    std::string symbol;
    std::vector<std::string> venues; // every venue that was fresh, sorted
    std::string buy_venue;           // min price
    std::string sell_venue;          // max price
    Decimal min_price;
    Decimal max_price;
    Decimal spread;                  // (max - min) / min
    std::int64_t ts_ms{0};           // event time of the trade that triggered it
};

// {"type":"spread","s":"BTC-USD","venues":[...],"buy":"a","sell":"b","min":"100","max":"106","spread":"0.06","ts":11}
std::string to_json_line(const SpreadEvent& ev);
