#include "pipeline/dispatcher.hpp"

#include <stdexcept>

#include "util/log.hpp"

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// 1, 2, 4, 8, ... so a persistently failing consumer does not flood stderr.
bool worth_logging(std::uint64_t n) { return (n & (n - 1)) == 0; }

} // namespace

Dispatcher::~Dispatcher() { stop(); }

void Dispatcher::add_sink(std::shared_ptr<ISink> sink, ConsumerOptions opts) {
    if (!sink) throw std::invalid_argument("add_sink: null sink");
    const std::string name = sink->name();
    add_consumer(
        name,
        [sink](const CanonicalEvent& ev) { return sink->send(ev); },
        [sink](const SpreadEvent& ev) { return sink->send(ev); },
        opts);
}

void Dispatcher::add_consumer(std::string name, EventHandler on_event, SpreadHandler on_spread,
                              ConsumerOptions opts) {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    if (started_) throw std::logic_error("Dispatcher: consumers must be added before start()");
    consumers_.push_back(std::make_unique<Consumer>(std::move(name), std::move(on_event),
                                                    std::move(on_spread), opts));
}

void Dispatcher::start() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    if (started_) return;
    started_ = true;
    for (auto& c : consumers_) {
        Consumer* raw = c.get();
        c->worker = std::thread([this, raw] { consume_loop(*raw); });
    }
}

void Dispatcher::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    if (stopped_) return;
    stopped_ = true;
    for (auto& c : consumers_) c->queue.close();
    for (auto& c : consumers_) {
        if (c->worker.joinable()) c->worker.join();
    }
}

bool Dispatcher::is_auxiliary_item(const Item& item) {
    const auto* ev = std::get_if<CanonicalEventPtr>(&item);
    return ev && *ev && is_auxiliary((*ev)->kind());
}

void Dispatcher::publish(CanonicalEventPtr ev) {
    if (!ev) return;
    for (auto& c : consumers_) {
        if (c->on_event) deliver(*c, Item{ev});
    }
}

void Dispatcher::publish_spread(const SpreadEvent& ev) {
    auto shared = std::make_shared<const SpreadEvent>(ev);
    for (auto& c : consumers_) {
        if (c->on_spread) deliver(*c, Item{shared});
    }
}

void Dispatcher::publish_rejected(const CanonicalEvent& ev, const std::string& reason) {
    const auto n = rejected_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (worth_logging(n)) {
        log_line("dispatch", "rejected ", kind_name(ev.kind()), " ", ev.symbol, " from ",
                 venue_name(ev.venue), ": ", reason, " (total ", n, ")");
    }
    if (on_rejected_) on_rejected_(ev, reason);
}

void Dispatcher::deliver(Consumer& c, Item item) {
    const Backpressure policy = is_auxiliary_item(item) ? c.opts.auxiliary : c.opts.primary;

    if (policy == Backpressure::DropOldest) {
        const bool all_droppable = c.opts.primary == Backpressure::DropOldest;
        const auto lost = c.queue.push_evicting(item, [all_droppable](const Item& queued) {
            return all_droppable || is_auxiliary_item(queued);
        });
        if (lost) c.dropped.fetch_add(lost, std::memory_order_relaxed);
        return;
    }

    if (c.queue.try_push(item)) return;

    // A consumer that already timed out is not waited on again until it drains.
    if (c.stalled.load(std::memory_order_acquire) || !c.queue.push_for(item, c.opts.block_timeout)) {
        const auto n = c.timed_out.fetch_add(1, std::memory_order_relaxed) + 1;
        if (!c.stalled.exchange(true, std::memory_order_acq_rel)) {
            log_line("dispatch", "consumer ", c.name, " saturated (", c.queue.size(),
                     " queued); failing deliveries to it (timed out ", n, ")");
        }
    }
}

void Dispatcher::consume_loop(Consumer& c) {
    Item item;
    while (c.queue.wait_pop(item)) {
        if (c.stalled.load(std::memory_order_acquire) && c.queue.size() <= c.queue.capacity() / 2) {
            c.stalled.store(false, std::memory_order_release);
            log_line("dispatch", "consumer ", c.name, " recovered");
        }

        bool ok = false;
        try {
            ok = std::visit(overloaded{
                [&](const CanonicalEventPtr& ev) { return c.on_event(*ev); },
                [&](const std::shared_ptr<const SpreadEvent>& ev) { return c.on_spread(*ev); },
            }, item);
        } catch (const std::exception& e) {
            log_line("dispatch", "consumer ", c.name, " threw: ", e.what());
            ok = false;
        }

        if (ok) {
            c.delivered.fetch_add(1, std::memory_order_relaxed);
        } else {
            const auto n = c.failed.fetch_add(1, std::memory_order_relaxed) + 1;
            if (worth_logging(n)) {
                log_line("dispatch", "consumer ", c.name, " failed a delivery (total ", n, ")");
            }
        }
        item = Item{};
    }
}

std::vector<ConsumerStats> Dispatcher::stats() const {
    std::vector<ConsumerStats> out;
    out.reserve(consumers_.size());
    for (const auto& c : consumers_) {
        ConsumerStats s;
        s.name = c->name;
        s.delivered = c->delivered.load(std::memory_order_relaxed);
        s.failed = c->failed.load(std::memory_order_relaxed);
        s.timed_out = c->timed_out.load(std::memory_order_relaxed);
        s.dropped = c->dropped.load(std::memory_order_relaxed);
        s.queued = c->queue.size();
        out.push_back(std::move(s));
    }
    return out;
}
