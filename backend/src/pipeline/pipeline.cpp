#include "pipeline/pipeline.hpp"

#include <sstream>

#include "util/log.hpp"

namespace {
bool worth_logging(std::uint64_t n) { return (n & (n - 1)) == 0; }
}

Pipeline::Pipeline(Canonicalizer canonicalizer,
                   std::vector<AgentSpec> agents,
                   std::vector<std::shared_ptr<ISink>> sinks,
                   PipelineOptions opts)
    : canonicalizer_(std::move(canonicalizer)),
      detector_(opts.analytics),
      supervisor_(std::move(agents), opts.supervisor,
                  [this](std::size_t i, RawEvent&& ev) { ingest(i, std::move(ev)); }) {
    for (std::size_t i = 0; i < supervisor_.size(); ++i) {
        rings_.push_back(std::make_unique<SpscRing<RawEvent>>(opts.ingress_capacity));
    }

    for (auto& sink : sinks) dispatcher_.add_sink(std::move(sink), opts.sinks);

    // Analytics: trades in, spreads out to the sinks.
    dispatcher_.add_consumer(
        "analytics",
        [this](const CanonicalEvent& ev) {
            if (auto spread = detector_.on_event(ev)) {
                spreads_.fetch_add(1, std::memory_order_relaxed);
                dispatcher_.publish_spread(*spread);
            }
            return true;
        },
        nullptr,
        opts.analytics_consumer);
}

Pipeline::~Pipeline() { stop(); }

void Pipeline::start() {
    if (started_) return;
    started_ = true;
    dispatcher_.start();
    running_.store(true, std::memory_order_release);
    stage_ = std::thread([this] { stage_loop(); });
    supervisor_.start();
}

void Pipeline::stop() {
    if (stopped_) return;
    stopped_ = true;
    // Producers first, then the stage (which drains), then the consumers.
    supervisor_.stop();
    running_.store(false, std::memory_order_release);
    if (stage_.joinable()) stage_.join();
    dispatcher_.stop();
}

void Pipeline::ingest(std::size_t agent_index, RawEvent&& ev) {
    auto& ring = *rings_.at(agent_index);
    raw_events_.fetch_add(1, std::memory_order_relaxed);
    if (ring.try_push(std::move(ev))) return;

    // Stage is behind: wait for room, but never past shutdown.
    ingress_waits_.fetch_add(1, std::memory_order_relaxed);
    while (!ring.try_push(std::move(ev))) {
        if (supervisor_.stop_signal().stop_requested()) return;
        std::this_thread::sleep_for(std::chrono::microseconds(50));
    }
}

/*
 * Stage loop: round-robin over agent rings, one event per ring per pass so a
 * chatty agent cannot starve the others.
 */
void Pipeline::stage_loop() {
    while (running_.load(std::memory_order_acquire)) {
        if (drain_once() == 0) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }
    // drain on shutdown
    while (drain_once() != 0) {
    }
}

std::size_t Pipeline::drain_once() {
    std::size_t n = 0;
    RawEvent raw;
    for (auto& ring : rings_) {
        if (ring->try_pop(raw)) {
            process(raw);
            ++n;
        }
    }
    return n;
}

void Pipeline::process(RawEvent& raw) {
    auto result = canonicalizer_.canonicalize(raw);
    if (auto* err = std::get_if<NormalizationError>(&result)) {
        const auto n = errors_[static_cast<std::size_t>(err->code)].fetch_add(1, std::memory_order_relaxed) + 1;
        if (worth_logging(n)) {
            log_line("canonical", venue_name(raw.venue), " ", kind_name(raw.kind), ": ", err->message(),
                     " (", to_string(err->code), " total ", n, ")");
        }
        return;
    }

    auto& ev = std::get<CanonicalEvent>(result);
    if (auto reason = canonicalizer_.validate(ev)) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        dispatcher_.publish_rejected(ev, *reason);
        return;
    }

    published_.fetch_add(1, std::memory_order_relaxed);
    dispatcher_.publish(std::make_shared<const CanonicalEvent>(std::move(ev)));
}

PipelineStats Pipeline::stats() const {
    PipelineStats s;
    s.raw_events = raw_events_.load(std::memory_order_relaxed);
    s.published = published_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < s.errors.size(); ++i) s.errors[i] = errors_[i].load(std::memory_order_relaxed);
    s.ingress_waits = ingress_waits_.load(std::memory_order_relaxed);
    s.spreads = spreads_.load(std::memory_order_relaxed);
    return s;
}

std::vector<std::string> Pipeline::status_lines() const {
    std::vector<std::string> lines;
    for (const auto& a : supervisor_.status()) {
        std::ostringstream os;
        os << "agent " << a.name << " " << to_string(a.state) << " events=" << a.events
           << " restarts=" << a.restarts << " failures=" << a.consecutive_failures;
        if (!a.last_error.empty()) os << " last_error=\"" << a.last_error << "\"";
        lines.push_back(os.str());
    }
    const auto s = stats();
    {
        std::ostringstream os;
        os << "stage raw=" << s.raw_events << " published=" << s.published << " rejected=" << s.rejected
           << " unknown_symbol=" << s.errors[static_cast<std::size_t>(NormalizationErrorCode::UnknownSymbolFormat)]
           << " missing_field=" << s.errors[static_cast<std::size_t>(NormalizationErrorCode::MissingField)]
           << " feature_disabled=" << s.errors[static_cast<std::size_t>(NormalizationErrorCode::FeatureDisabled)]
           << " ingress_waits=" << s.ingress_waits << " spreads=" << s.spreads;
        lines.push_back(os.str());
    }
    for (const auto& c : dispatcher_.stats()) {
        std::ostringstream os;
        os << "consumer " << c.name << " delivered=" << c.delivered << " failed=" << c.failed
           << " timed_out=" << c.timed_out << " dropped=" << c.dropped << " queued=" << c.queued;
        lines.push_back(os.str());
    }
    return lines;
}
