#include "analytics/spread_detector.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

std::string to_json_line(const SpreadEvent& ev) {
    nlohmann::ordered_json j;
    j["type"] = "spread";
    j["s"] = ev.symbol;
    j["venues"] = ev.venues;
    j["buy"] = ev.buy_venue;
    j["sell"] = ev.sell_venue;
    j["min"] = ev.min_price.str();
    j["max"] = ev.max_price.str();
    j["spread"] = ev.spread.str();
    j["ts"] = ev.ts_ms;
    return j.dump();
}

SpreadDetector::~SpreadDetector() {
    std::lock_guard<std::mutex> lk(subs_m_);
    for (auto& w : subs_) {
        if (auto s = w.lock()) s->close();
    }
}

std::optional<SpreadEvent> SpreadDetector::on_event(const CanonicalEvent& ev) {
    const auto* trade = std::get_if<Trade>(&ev.body);
    if (!trade) return std::nullopt;
    return on_trade(venue_name(ev.venue), ev.symbol, trade->price, ev.ts_ms, ev.received_ms);
}

std::optional<SpreadEvent> SpreadDetector::on_trade(const std::string& venue,
                                                    const std::string& symbol,
                                                    const Decimal& price,
                                                    std::int64_t ts_ms,
                                                    std::int64_t received_ms) {
    auto& venues = state_[symbol];

    auto it = venues.find(venue);
    if (it != venues.end() && it->second.ts_ms >= ts_ms) {
        ++stale_rejections_;
        return std::nullopt;
    }
    venues[venue] = VenueQuote{price, ts_ms, received_ms};

    const std::int64_t window = opts_.staleness_window.count();
    const VenuePriceState::value_type* lo = nullptr;
    const VenuePriceState::value_type* hi = nullptr;
    std::vector<std::string> fresh;
    for (const auto& kv : venues) {
        if (received_ms - kv.second.received_ms > window) continue;
        fresh.push_back(kv.first);
        if (!lo || kv.second.price < lo->second.price) lo = &kv;
        if (!hi || kv.second.price > hi->second.price) hi = &kv;
    }
    if (fresh.size() < 2 || lo->second.price.value() <= 0) return std::nullopt;

    // (max - min) / min > threshold, compared without dividing
    const DecimalValue diff = hi->second.price.value() - lo->second.price.value();
    if (!(diff > opts_.threshold * lo->second.price.value())) return std::nullopt;

    auto last = last_emit_ms_.find(symbol);
    if (last != last_emit_ms_.end() && received_ms - last->second < opts_.debounce_interval.count()) {
        ++debounced_;
        return std::nullopt;
    }
    last_emit_ms_[symbol] = received_ms;

    SpreadEvent out;
    out.symbol = symbol;
    out.venues = std::move(fresh);
    out.buy_venue = lo->first;
    out.sell_venue = hi->first;
    out.min_price = lo->second.price;
    out.max_price = hi->second.price;
    out.spread = Decimal::from_value(diff / lo->second.price.value());
    out.ts_ms = ts_ms;

    ++emitted_;
    notify(out);
    return out;
}

std::shared_ptr<SpreadSubscription> SpreadDetector::subscribe(std::size_t capacity) {
    auto sub = std::make_shared<SpreadSubscription>(capacity);
    std::lock_guard<std::mutex> lk(subs_m_);
    subs_.push_back(sub);
    return sub;
}

const VenuePriceState* SpreadDetector::state(const std::string& symbol) const {
    auto it = state_.find(symbol);
    if (it == state_.end()) return nullptr;
    return &it->second;
}

void SpreadDetector::notify(const SpreadEvent& ev) {
    std::lock_guard<std::mutex> lk(subs_m_);
    subs_.erase(std::remove_if(subs_.begin(), subs_.end(),
                               [](const std::weak_ptr<SpreadSubscription>& w) { return w.expired(); }),
                subs_.end());
    for (auto& w : subs_) {
        if (auto s = w.lock()) s->offer(ev);
    }
}
