#pragma once
#include "venues/payload.hpp"
#include "venues/agent.hpp"

#include <simdjson.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Coinbase Exchange websocket feed parser (matches, ticker, level2_batch, heartbeat).
class CoinbaseFrameParser {
public:
    static constexpr Venue kVenue = Venue::Coinbase;
    static constexpr const char* kName = "coinbase";
    static constexpr const char* kUserAgent = "coinbase-ws-connector/0.4";

    explicit CoinbaseFrameParser(FeatureSet features) : features_(features) {}

    // {"type":"subscribe","product_ids":["BTC-USD"],"channels":["heartbeat","matches",...]}
    std::vector<std::string> subscribe_messages(const std::vector<std::string>& product_ids) const {
        nlohmann::json channels = nlohmann::json::array({"heartbeat"});
        if (features_.enabled(EventKind::Trade)) channels.push_back("matches");
        if (features_.enabled(EventKind::BookTicker) || features_.enabled(EventKind::Ticker24h))
            channels.push_back("ticker");
        if (features_.enabled(EventKind::L2Diff) || features_.enabled(EventKind::L2Snapshot))
            channels.push_back("level2_batch");
        nlohmann::json sub = {{"type", "subscribe"}, {"product_ids", product_ids}, {"channels", std::move(channels)}};
        return {sub.dump()};
    }

    void parse(const std::string& raw, std::int64_t received_ms, std::vector<RawEvent>& out) {
        nlohmann::json msg = decode_frame(parser_, raw);
        if (!msg.is_object()) throw ProtocolError("coinbase: frame is not an object");

        const std::string type = msg.value("type", std::string());
        if (type == "match" || type == "last_match") {
            emit(EventKind::Trade, std::move(msg), received_ms, out);
        } else if (type == "ticker") {
            if (msg.contains("best_bid")) emit(EventKind::BookTicker, msg, received_ms, out);
            if (msg.contains("open_24h")) emit(EventKind::Ticker24h, std::move(msg), received_ms, out);
        } else if (type == "snapshot") {
            emit(EventKind::L2Snapshot, std::move(msg), received_ms, out);
        } else if (type == "l2update") {
            emit(EventKind::L2Diff, split_changes(msg), received_ms, out);
        } else if (type == "error") {
            throw ProtocolError("coinbase: " + msg.value("message", std::string("error")) +
                                (msg.contains("reason") ? ": " + msg.value("reason", std::string()) : std::string()));
        }
        // heartbeat / subscriptions: liveness only
    }

private:
    // "changes":[["buy","price","size"],...] -> "bids"/"asks":[["price","size"],...]
    static nlohmann::json split_changes(const nlohmann::json& msg) {
        nlohmann::json diff = nlohmann::json::object();
        diff["product_id"] = msg.value("product_id", std::string());
        if (auto t = msg.find("time"); t != msg.end()) diff["time"] = *t;
        nlohmann::json bids = nlohmann::json::array();
        nlohmann::json asks = nlohmann::json::array();
        auto changes = msg.find("changes");
        if (changes == msg.end() || !changes->is_array()) throw ProtocolError("coinbase: l2update without changes");
        for (const auto& ch : *changes) {
            if (!ch.is_array() || ch.size() < 3 || !ch[0].is_string()) throw ProtocolError("coinbase: bad l2update change");
            const auto side = ch[0].get<std::string>();
            nlohmann::json level = nlohmann::json::array({ch[1], ch[2]});
            if (side == "buy") bids.push_back(std::move(level));
            else if (side == "sell") asks.push_back(std::move(level));
            else throw ProtocolError("coinbase: unknown l2update side '" + side + "'");
        }
        diff["bids"] = std::move(bids);
        diff["asks"] = std::move(asks);
        return diff;
    }

    void emit(EventKind kind, nlohmann::json payload, std::int64_t received_ms, std::vector<RawEvent>& out) const {
        if (!features_.enabled(kind)) return;
        out.push_back(RawEvent{kVenue, kind, std::move(payload), received_ms});
    }

    FeatureSet features_;
    simdjson::ondemand::parser parser_;
};
