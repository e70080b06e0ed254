#include "canonicalizer.hpp"

#include <array>
#include <charconv>
#include <limits>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "field_map.hpp"

namespace {

// Reads canonical fields out of a raw payload through the venue field map.
// The first missing or ill-typed required field is remembered; later reads
// keep returning defaults so a body can be built unconditionally.
class FieldReader {
public:
    FieldReader(const nlohmann::json& payload, const FieldMap* map)
        : payload_(payload), map_(map) {}

    Decimal decimal(const char* key) {
        const auto* v = find(key);
        if (v) {
            if (auto d = to_decimal(*v)) return *d;
        }
        fail(key);
        return Decimal();
    }

    std::string text(const char* key) {
        const auto* v = find(key);
        if (v && v->is_string() && !v->get_ref<const std::string&>().empty())
            return v->get<std::string>();
        fail(key);
        return {};
    }

    std::string opt_text(const char* key) const {
        const auto* v = find(key);
        if (v && v->is_string()) return v->get<std::string>();
        return {};
    }

    std::optional<std::int64_t> opt_integer(const char* key) const {
        const auto* v = find(key);
        if (!v) return std::nullopt;
        return to_integer(*v);
    }

    std::optional<bool> opt_flag(const char* key) const {
        const auto* v = find(key);
        if (v && v->is_boolean()) return v->get<bool>();
        return std::nullopt;
    }

    std::vector<PriceLevel> levels(const char* key) {
        std::vector<PriceLevel> out;
        const auto* v = find(key);
        if (!v || !v->is_array()) {
            fail(key);
            return out;
        }
        out.reserve(v->size());
        for (const auto& lv : *v) {
            if (!lv.is_array() || lv.size() < 2) {
                fail(key);
                return {};
            }
            auto p = to_decimal(lv[0]);
            auto q = to_decimal(lv[1]);
            if (!p || !q) {
                fail(key);
                return {};
            }
            out.push_back(PriceLevel{std::move(*p), std::move(*q)});
        }
        return out;
    }

    // Event time in ms. nullopt when the venue sends none; a present but
    // unreadable value is an error.
    std::optional<std::int64_t> timestamp() {
        const auto* v = find("ts");
        if (!v) return std::nullopt;
        if (v->is_string()) {
            const auto& s = v->get_ref<const std::string&>();
            if (s.find('T') != std::string::npos) {
                if (auto ms = parse_iso8601_ms(s)) return ms;
                fail("ts");
                return std::nullopt;
            }
        }
        if (auto ms = to_integer(*v)) return ms;
        fail("ts");
        return std::nullopt;
    }

    const std::optional<NormalizationError>& error() const noexcept { return error_; }

private:
    const nlohmann::json* find(const char* key) const {
        std::string path = key;
        if (map_) {
            auto it = map_->find(key);
            if (it != map_->end()) path = it->second;
        }
        const nlohmann::json* cur = &payload_;
        std::size_t start = 0;
        while (true) {
            if (!cur->is_object()) return nullptr;
            const auto dot = path.find('.', start);
            const std::string part = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            auto it = cur->find(part);
            if (it == cur->end() || it->is_null()) return nullptr;
            cur = &*it;
            if (dot == std::string::npos) return cur;
            start = dot + 1;
        }
    }

    void fail(const char* key) {
        if (!error_) error_ = NormalizationError::missing_field(key);
    }

    // Decimals arrive as source text; integers are accepted, binary floats are not.
    static std::optional<Decimal> to_decimal(const nlohmann::json& v) {
        if (v.is_string()) return Decimal::parse(v.get_ref<const std::string&>());
        if (v.is_number_integer()) return Decimal::parse(v.dump());
        return std::nullopt;
    }

    static std::optional<std::int64_t> to_integer(const nlohmann::json& v) {
        if (v.is_number_unsigned()) {
            const auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
            return static_cast<std::int64_t>(u);
        }
        if (v.is_number_integer()) return v.get<std::int64_t>();
        if (v.is_string()) {
            const auto& s = v.get_ref<const std::string&>();
            std::int64_t out = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec == std::errc() && ptr == s.data() + s.size()) return out;
        }
        return std::nullopt;
    }

    // "2024-01-01T00:00:00.123456Z" -> ms since epoch (UTC only).
    static std::optional<std::int64_t> parse_iso8601_ms(std::string s) {
        if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) s.pop_back();
        else if (s.size() > 6 && s.compare(s.size() - 6, 6, "+00:00") == 0) s.resize(s.size() - 6);
        try {
            const auto t = boost::posix_time::from_iso_extended_string(s);
            if (t.is_special()) return std::nullopt;
            static const boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
            return (t - epoch).total_milliseconds();
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    const nlohmann::json& payload_;
    const FieldMap* map_;
    std::optional<NormalizationError> error_;
};

using BodyBuilder = CanonicalBody (*)(FieldReader&);

CanonicalBody build_trade(FieldReader& r) {
    Trade b;
    b.price = r.decimal("p");
    b.qty = r.decimal("q");
    b.trade_id = r.opt_integer("t");
    b.side = r.opt_text("side");
    return b;
}

CanonicalBody build_l2_diff(FieldReader& r) {
    L2Diff b;
    b.bids = r.levels("bids");
    b.asks = r.levels("asks");
    b.update_id = r.opt_integer("u");
    return b;
}

CanonicalBody build_l2_snapshot(FieldReader& r) {
    L2Snapshot b;
    b.bids = r.levels("bids");
    b.asks = r.levels("asks");
    b.update_id = r.opt_integer("u");
    return b;
}

CanonicalBody build_book_ticker(FieldReader& r) {
    BookTicker b;
    b.bid_price = r.decimal("bp");
    b.bid_qty = r.decimal("bq");
    b.ask_price = r.decimal("ap");
    b.ask_qty = r.decimal("aq");
    return b;
}

CanonicalBody build_ticker_24h(FieldReader& r) {
    Ticker24h b;
    b.open = r.decimal("o");
    b.high = r.decimal("h");
    b.low = r.decimal("l");
    b.close = r.decimal("c");
    b.volume = r.decimal("v");
    return b;
}

CanonicalBody build_ohlcv(FieldReader& r) {
    Ohlcv b;
    b.interval = r.text("i");
    b.open = r.decimal("o");
    b.high = r.decimal("h");
    b.low = r.decimal("l");
    b.close = r.decimal("c");
    b.volume = r.decimal("v");
    b.closed = r.opt_flag("closed");
    return b;
}

CanonicalBody build_index_price(FieldReader& r) { return IndexPrice{r.decimal("p")}; }
CanonicalBody build_mark_price(FieldReader& r) { return MarkPrice{r.decimal("p")}; }

CanonicalBody build_funding(FieldReader& r) {
    FundingRate b;
    b.rate = r.decimal("r");
    b.next_funding_ms = r.opt_integer("nft");
    return b;
}

CanonicalBody build_open_interest(FieldReader& r) { return OpenInterest{r.decimal("oi")}; }

CanonicalBody build_onchain_transfer(FieldReader& r) {
    OnchainTransfer b;
    b.hash = r.text("hash");
    b.from = r.text("from");
    b.to = r.text("to");
    b.amount = r.decimal("amount");
    b.chain = r.opt_text("chain");
    return b;
}

CanonicalBody build_onchain_balance(FieldReader& r) {
    OnchainBalance b;
    b.address = r.text("address");
    b.balance = r.decimal("balance");
    b.chain = r.opt_text("chain");
    return b;
}

CanonicalBody build_top_dex_pool(FieldReader& r) {
    TopDexPool b;
    b.pool = r.text("pool");
    b.liquidity = r.decimal("liquidity");
    b.volume = r.decimal("volume");
    b.dex = r.opt_text("dex");
    return b;
}

CanonicalBody build_news_headline(FieldReader& r) {
    NewsHeadline b;
    b.headline = r.text("headline");
    b.source = r.text("source");
    b.url = r.opt_text("url");
    return b;
}

CanonicalBody build_telemetry(FieldReader& r) {
    Telemetry b;
    b.name = r.text("name");
    b.value = r.decimal("value");
    return b;
}

CanonicalBody build_options_chain(FieldReader& r) {
    OptionsChain b;
    b.strike = r.decimal("strike");
    b.expiry = r.text("expiry");
    b.option_type = r.text("option_type");
    b.price = r.decimal("p");
    b.qty = r.decimal("q");
    return b;
}

CanonicalBody build_mempool(FieldReader& r) {
    Mempool b;
    b.hash = r.text("hash");
    b.value = r.decimal("value");
    return b;
}

CanonicalBody build_bridge_flow(FieldReader& r) {
    BridgeFlow b;
    b.amount = r.decimal("amount");
    b.from_chain = r.text("from_chain");
    b.to_chain = r.text("to_chain");
    return b;
}

CanonicalBody build_mev_signal(FieldReader& r) {
    MevSignal b;
    b.strategy = r.text("strategy");
    b.profit = r.decimal("profit");
    return b;
}

// Indexed by EventKind.
constexpr std::array<BodyBuilder, kEventKindCount> kBuilders = {
    build_trade,           build_l2_diff,         build_l2_snapshot,   build_book_ticker,
    build_ticker_24h,      build_ohlcv,           build_index_price,   build_mark_price,
    build_funding,         build_open_interest,   build_onchain_transfer,
    build_onchain_balance, build_top_dex_pool,    build_news_headline, build_telemetry,
    build_options_chain,   build_mempool,         build_bridge_flow,   build_mev_signal,
};

} // namespace

std::variant<CanonicalEvent, NormalizationError> Canonicalizer::canonicalize(const RawEvent& raw) const {
    if (!features_.enabled(raw.kind)) {
        return NormalizationError::feature_disabled(raw.kind);
    }

    FieldReader reader(raw.payload, find_field_map(raw.venue, raw.kind));

    const std::string venue_symbol = reader.text("s");
    if (auto err = reader.error()) return *err;

    // options chain rows are keyed by their underlying; every other kind needs the instrument itself
    auto symbol = raw.kind == EventKind::OptionsChain ? codec_.underlying(raw.venue, venue_symbol)
                                                      : codec_.to_canonical(raw.venue, venue_symbol);
    if (!symbol) {
        return NormalizationError::unknown_symbol(venue_symbol);
    }

    CanonicalBody body = kBuilders[static_cast<std::size_t>(raw.kind)](reader);
    const auto ts = reader.timestamp();
    if (auto err = reader.error()) return *err;

    CanonicalEvent ev;
    ev.venue = raw.venue;
    ev.symbol = std::move(*symbol);
    ev.ts_ms = ts.value_or(raw.received_ms);
    ev.received_ms = raw.received_ms;
    ev.body = std::move(body);
    return ev;
}
