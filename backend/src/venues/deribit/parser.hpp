#pragma once
#include "venues/payload.hpp"
#include "venues/agent.hpp"

#include <simdjson.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Deribit JSON-RPC v2 parser: trades.<instrument>.100ms and ticker.<instrument>.100ms.
// One ticker notification fans out to book ticker, mark, index, open interest
// and (perpetuals only) funding.
class DeribitFrameParser {
public:
    static constexpr Venue kVenue = Venue::Deribit;
    static constexpr const char* kName = "deribit";
    static constexpr const char* kUserAgent = "xfeed-deribit/1.0";

    explicit DeribitFrameParser(FeatureSet features) : features_(features) {}

    std::vector<std::string> subscribe_messages(const std::vector<std::string>& instruments) const {
        const bool want_ticker = features_.enabled(EventKind::BookTicker) ||
                                 features_.enabled(EventKind::MarkPrice) ||
                                 features_.enabled(EventKind::IndexPrice) ||
                                 features_.enabled(EventKind::OpenInterest) ||
                                 features_.enabled(EventKind::FundingRate);
        nlohmann::json channels = nlohmann::json::array();
        for (const auto& inst : instruments) {
            if (features_.enabled(EventKind::Trade)) channels.push_back("trades." + inst + ".100ms");
            if (want_ticker) channels.push_back("ticker." + inst + ".100ms");
        }
        if (channels.empty()) return {};
        nlohmann::json sub = {
            {"jsonrpc", "2.0"},
            {"id", 1},
            {"method", "public/subscribe"},
            {"params", {{"channels", std::move(channels)}}},
        };
        return {sub.dump()};
    }

    void parse(const std::string& raw, std::int64_t received_ms, std::vector<RawEvent>& out) {
        nlohmann::json msg = decode_frame(parser_, raw);
        if (!msg.is_object()) throw ProtocolError("deribit: frame is not an object");

        if (auto err = msg.find("error"); err != msg.end() && !err->is_null()) {
            throw ProtocolError("deribit: " + err->dump());
        }
        if (msg.value("method", std::string()) != "subscription") return; // acks, heartbeats

        auto params = msg.find("params");
        if (params == msg.end() || !params->is_object()) throw ProtocolError("deribit: subscription without params");
        const std::string channel = params->value("channel", std::string());
        auto data = params->find("data");
        if (data == params->end()) throw ProtocolError("deribit: subscription without data");

        if (channel.rfind("trades.", 0) == 0) {
            if (!data->is_array()) throw ProtocolError("deribit: trades data is not an array");
            for (auto& t : *data) emit(EventKind::Trade, std::move(t), received_ms, out);
        } else if (channel.rfind("ticker.", 0) == 0) {
            if (!data->is_object()) throw ProtocolError("deribit: ticker data is not an object");
            emit(EventKind::BookTicker, *data, received_ms, out);
            emit(EventKind::MarkPrice, *data, received_ms, out);
            emit(EventKind::IndexPrice, *data, received_ms, out);
            emit(EventKind::OpenInterest, *data, received_ms, out);
            if (data->contains("current_funding")) emit(EventKind::FundingRate, *data, received_ms, out);
        }
    }

private:
    void emit(EventKind kind, nlohmann::json payload, std::int64_t received_ms, std::vector<RawEvent>& out) const {
        if (!features_.enabled(kind)) return;
        out.push_back(RawEvent{kVenue, kind, std::move(payload), received_ms});
    }

    FeatureSet features_;
    simdjson::ondemand::parser parser_;
};
