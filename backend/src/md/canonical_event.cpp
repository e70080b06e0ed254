#include "canonical_event.hpp"

#include <nlohmann/json.hpp>

namespace
{
using ojson = nlohmann::ordered_json;

ojson levels_json(const std::vector<PriceLevel> &levels)
{
    ojson arr = ojson::array();
    for (const auto &lv : levels)
        arr.push_back(ojson::array({lv.price.str(), lv.qty.str()}));
    return arr;
}

void put_text(ojson &j, const char *key, const std::string &v)
{
    if (!v.empty()) j[key] = v;
}

struct BodyWriter
{
    ojson &j;

    void operator()(const Trade &b) const
    {
        if (b.trade_id) j["t"] = *b.trade_id;
        j["p"] = b.price.str();
        j["q"] = b.qty.str();
        put_text(j, "side", b.side);
    }
    void operator()(const L2Diff &b) const
    {
        j["bids"] = levels_json(b.bids);
        j["asks"] = levels_json(b.asks);
        if (b.update_id) j["u"] = *b.update_id;
    }
    void operator()(const L2Snapshot &b) const
    {
        j["bids"] = levels_json(b.bids);
        j["asks"] = levels_json(b.asks);
        if (b.update_id) j["u"] = *b.update_id;
    }
    void operator()(const BookTicker &b) const
    {
        j["bp"] = b.bid_price.str();
        j["bq"] = b.bid_qty.str();
        j["ap"] = b.ask_price.str();
        j["aq"] = b.ask_qty.str();
    }
    void operator()(const Ticker24h &b) const
    {
        j["o"] = b.open.str();
        j["h"] = b.high.str();
        j["l"] = b.low.str();
        j["c"] = b.close.str();
        j["v"] = b.volume.str();
    }
    void operator()(const Ohlcv &b) const
    {
        j["i"] = b.interval;
        j["o"] = b.open.str();
        j["h"] = b.high.str();
        j["l"] = b.low.str();
        j["c"] = b.close.str();
        j["v"] = b.volume.str();
        if (b.closed) j["closed"] = *b.closed;
    }
    void operator()(const IndexPrice &b) const { j["p"] = b.price.str(); }
    void operator()(const MarkPrice &b) const { j["p"] = b.price.str(); }
    void operator()(const FundingRate &b) const
    {
        j["r"] = b.rate.str();
        if (b.next_funding_ms) j["nft"] = *b.next_funding_ms;
    }
    void operator()(const OpenInterest &b) const { j["oi"] = b.open_interest.str(); }
    void operator()(const OnchainTransfer &b) const
    {
        j["hash"] = b.hash;
        j["from"] = b.from;
        j["to"] = b.to;
        j["amount"] = b.amount.str();
        put_text(j, "chain", b.chain);
    }
    void operator()(const OnchainBalance &b) const
    {
        j["address"] = b.address;
        j["balance"] = b.balance.str();
        put_text(j, "chain", b.chain);
    }
    void operator()(const TopDexPool &b) const
    {
        j["pool"] = b.pool;
        j["liquidity"] = b.liquidity.str();
        j["volume"] = b.volume.str();
        put_text(j, "dex", b.dex);
    }
    void operator()(const NewsHeadline &b) const
    {
        j["headline"] = b.headline;
        j["source"] = b.source;
        put_text(j, "url", b.url);
    }
    void operator()(const Telemetry &b) const
    {
        j["name"] = b.name;
        j["value"] = b.value.str();
    }
    void operator()(const OptionsChain &b) const
    {
        j["strike"] = b.strike.str();
        j["expiry"] = b.expiry;
        j["option_type"] = b.option_type;
        j["p"] = b.price.str();
        j["q"] = b.qty.str();
    }
    void operator()(const Mempool &b) const
    {
        j["hash"] = b.hash;
        j["value"] = b.value.str();
    }
    void operator()(const BridgeFlow &b) const
    {
        j["amount"] = b.amount.str();
        j["from_chain"] = b.from_chain;
        j["to_chain"] = b.to_chain;
    }
    void operator()(const MevSignal &b) const
    {
        j["strategy"] = b.strategy;
        j["profit"] = b.profit.str();
    }
};
} // namespace

std::string to_json_line(const CanonicalEvent &ev)
{
    ojson j;
    j["agent"] = venue_name(ev.venue);
    j["type"] = kind_name(ev.kind());
    j["s"] = ev.symbol;
    std::visit(BodyWriter{j}, ev.body);
    j["ts"] = ev.ts_ms;
    return j.dump();
}
