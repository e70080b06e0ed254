#include "field_map.hpp"

#include <map>
#include <utility>

namespace
{
using Key = std::pair<Venue, EventKind>;

const std::map<Key, FieldMap> &field_maps()
{
    static const std::map<Key, FieldMap> maps = {
        // Binance combined streams (spot + USD-M futures markPrice)
        {{Venue::Binance, EventKind::Trade},
         {{"s", "s"}, {"p", "p"}, {"q", "q"}, {"t", "t"}, {"ts", "T"}}},
        {{Venue::Binance, EventKind::L2Diff},
         {{"s", "s"}, {"bids", "b"}, {"asks", "a"}, {"u", "u"}, {"ts", "E"}}},
        {{Venue::Binance, EventKind::L2Snapshot},
         {{"s", "s"}, {"bids", "bids"}, {"asks", "asks"}, {"u", "lastUpdateId"}}},
        {{Venue::Binance, EventKind::BookTicker},
         {{"s", "s"}, {"bp", "b"}, {"bq", "B"}, {"ap", "a"}, {"aq", "A"}}},
        {{Venue::Binance, EventKind::Ticker24h},
         {{"s", "s"}, {"o", "o"}, {"h", "h"}, {"l", "l"}, {"c", "c"}, {"v", "v"}, {"ts", "E"}}},
        {{Venue::Binance, EventKind::Ohlcv},
         {{"s", "s"}, {"i", "k.i"}, {"o", "k.o"}, {"h", "k.h"}, {"l", "k.l"}, {"c", "k.c"},
          {"v", "k.v"}, {"closed", "k.x"}, {"ts", "E"}}},
        {{Venue::Binance, EventKind::MarkPrice},
         {{"s", "s"}, {"p", "p"}, {"ts", "E"}}},
        {{Venue::Binance, EventKind::IndexPrice},
         {{"s", "s"}, {"p", "i"}, {"ts", "E"}}},
        {{Venue::Binance, EventKind::FundingRate},
         {{"s", "s"}, {"r", "r"}, {"nft", "T"}, {"ts", "E"}}},

        // Coinbase exchange feed
        {{Venue::Coinbase, EventKind::Trade},
         {{"s", "product_id"}, {"p", "price"}, {"q", "size"}, {"t", "trade_id"}, {"side", "side"},
          {"ts", "time"}}},
        {{Venue::Coinbase, EventKind::BookTicker},
         {{"s", "product_id"}, {"bp", "best_bid"}, {"bq", "best_bid_size"}, {"ap", "best_ask"},
          {"aq", "best_ask_size"}, {"ts", "time"}}},
        {{Venue::Coinbase, EventKind::Ticker24h},
         {{"s", "product_id"}, {"o", "open_24h"}, {"h", "high_24h"}, {"l", "low_24h"}, {"c", "price"},
          {"v", "volume_24h"}, {"ts", "time"}}},
        {{Venue::Coinbase, EventKind::L2Diff},
         {{"s", "product_id"}, {"bids", "bids"}, {"asks", "asks"}, {"ts", "time"}}},
        {{Venue::Coinbase, EventKind::L2Snapshot},
         {{"s", "product_id"}, {"bids", "bids"}, {"asks", "asks"}, {"ts", "time"}}},

        // Deribit JSON-RPC subscription data
        {{Venue::Deribit, EventKind::Trade},
         {{"s", "instrument_name"}, {"p", "price"}, {"q", "amount"}, {"t", "trade_seq"},
          {"side", "direction"}, {"ts", "timestamp"}}},
        {{Venue::Deribit, EventKind::BookTicker},
         {{"s", "instrument_name"}, {"bp", "best_bid_price"}, {"bq", "best_bid_amount"},
          {"ap", "best_ask_price"}, {"aq", "best_ask_amount"}, {"ts", "timestamp"}}},
        {{Venue::Deribit, EventKind::MarkPrice},
         {{"s", "instrument_name"}, {"p", "mark_price"}, {"ts", "timestamp"}}},
        {{Venue::Deribit, EventKind::IndexPrice},
         {{"s", "instrument_name"}, {"p", "index_price"}, {"ts", "timestamp"}}},
        {{Venue::Deribit, EventKind::OpenInterest},
         {{"s", "instrument_name"}, {"oi", "open_interest"}, {"ts", "timestamp"}}},
        {{Venue::Deribit, EventKind::FundingRate},
         {{"s", "instrument_name"}, {"r", "current_funding"}, {"ts", "timestamp"}}},
    };
    return maps;
}
} // namespace

const FieldMap *find_field_map(Venue venue, EventKind kind)
{
    const auto &maps = field_maps();
    auto it = maps.find(Key{venue, kind});
    if (it == maps.end()) return nullptr;
    return &it->second;
}
