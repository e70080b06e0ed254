#pragma once
#include "venues/payload.hpp"
#include "venues/agent.hpp"

#include <simdjson.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <string>
#include <vector>

// Binance combined-stream parser.
// Frames look like {"stream":"btcusdt@trade","data":{...}}; subscription
// acks are {"result":null,"id":1}.
class BinanceFrameParser {
public:
    static constexpr Venue kVenue = Venue::Binance;
    static constexpr const char* kName = "binance";
    static constexpr const char* kUserAgent = "xfeed-binance/1.0";

    explicit BinanceFrameParser(FeatureSet features) : features_(features) {}

    std::vector<std::string> subscribe_messages(const std::vector<std::string>& symbols) const {
        nlohmann::json params = nlohmann::json::array();
        for (const auto& sym : symbols) {
            std::string s = sym;
            for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            if (features_.enabled(EventKind::Trade))      params.push_back(s + "@trade");
            if (features_.enabled(EventKind::L2Diff))     params.push_back(s + "@depth@100ms");
            if (features_.enabled(EventKind::L2Snapshot)) params.push_back(s + "@depth20@100ms");
            if (features_.enabled(EventKind::BookTicker)) params.push_back(s + "@bookTicker");
            if (features_.enabled(EventKind::Ticker24h))  params.push_back(s + "@ticker");
            if (features_.enabled(EventKind::Ohlcv))      params.push_back(s + "@kline_1m");
            if (features_.enabled(EventKind::MarkPrice) ||
                features_.enabled(EventKind::IndexPrice) ||
                features_.enabled(EventKind::FundingRate)) params.push_back(s + "@markPrice");
        }
        if (params.empty()) return {};
        nlohmann::json sub = {{"method", "SUBSCRIBE"}, {"params", std::move(params)}, {"id", 1}};
        return {sub.dump()};
    }

    void parse(const std::string& raw, std::int64_t received_ms, std::vector<RawEvent>& out) {
        nlohmann::json root = decode_frame(parser_, raw);
        if (!root.is_object()) throw ProtocolError("binance: frame is not an object");

        // {"result":null,"id":1} or {"error":{"code":2,"msg":"..."},"id":1}
        if (root.contains("id")) {
            auto err = root.find("error");
            if (err != root.end() && !err->is_null()) {
                throw ProtocolError("binance: subscription rejected: " + err->dump());
            }
            return;
        }

        std::string stream;
        nlohmann::json data;
        auto d = root.find("data");
        if (d != root.end()) {
            if (auto s = root.find("stream"); s != root.end() && s->is_string()) stream = s->get<std::string>();
            data = std::move(*d);
        } else {
            data = std::move(root);
        }
        if (!data.is_object()) throw ProtocolError("binance: stream data is not an object");

        const std::string event = data.value("e", std::string());
        if (event == "trade") {
            emit(EventKind::Trade, std::move(data), received_ms, out);
        } else if (event == "depthUpdate") {
            emit(EventKind::L2Diff, std::move(data), received_ms, out);
        } else if (event == "24hrTicker") {
            emit(EventKind::Ticker24h, std::move(data), received_ms, out);
        } else if (event == "kline") {
            emit(EventKind::Ohlcv, std::move(data), received_ms, out);
        } else if (event == "markPriceUpdate") {
            emit(EventKind::MarkPrice, data, received_ms, out);
            emit(EventKind::IndexPrice, data, received_ms, out);
            emit(EventKind::FundingRate, std::move(data), received_ms, out);
        } else if (event.empty() && data.contains("lastUpdateId")) {
            // Partial depth carries no symbol; take it from the stream name.
            const auto at = stream.find('@');
            if (at == std::string::npos || at == 0) throw ProtocolError("binance: depth snapshot without stream name");
            data["s"] = stream.substr(0, at);
            emit(EventKind::L2Snapshot, std::move(data), received_ms, out);
        } else if (event.empty() && data.contains("u") && data.contains("b") && data.contains("a")) {
            emit(EventKind::BookTicker, std::move(data), received_ms, out);
        }
        // anything else is a stream this parser does not map
    }

private:
    void emit(EventKind kind, nlohmann::json payload, std::int64_t received_ms, std::vector<RawEvent>& out) const {
        if (!features_.enabled(kind)) return;
        out.push_back(RawEvent{kVenue, kind, std::move(payload), received_ms});
    }

    FeatureSet features_;
    simdjson::ondemand::parser parser_;
};
