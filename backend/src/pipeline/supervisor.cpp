#include "pipeline/supervisor.hpp"

#include <algorithm>
#include <stdexcept>

#include "util/log.hpp"

using Clock = std::chrono::steady_clock;

const char* to_string(AgentState s) noexcept {
    switch (s) {
        case AgentState::Connecting:   return "connecting";
        case AgentState::Streaming:    return "streaming";
        case AgentState::Disconnected: return "disconnected";
        case AgentState::Failed:       return "failed";
        case AgentState::Stopped:      return "stopped";
    }
    return "unknown";
}

Supervisor::Supervisor(std::vector<AgentSpec> agents, SupervisorOptions opts, RawHandler on_raw)
    : opts_(opts), on_raw_(std::move(on_raw)) {
    if (!on_raw_) throw std::invalid_argument("Supervisor: raw event handler required");
    slots_.reserve(agents.size());
    for (auto& spec : agents) {
        if (!spec.factory) throw std::invalid_argument("Supervisor: agent '" + spec.name + "' has no factory");
        auto slot = std::make_unique<Slot>();
        slot->status.name = spec.name;
        slot->spec = std::move(spec);
        slots_.push_back(std::move(slot));
    }
}

Supervisor::~Supervisor() { stop(); }

void Supervisor::start() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    if (started_) return;
    started_ = true;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        Slot* slot = slots_[i].get();
        slot->worker = std::thread([this, slot, i] { run_agent(*slot, i); });
    }
}

void Supervisor::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    stop_.request_stop();
    if (joined_) return;
    joined_ = true;
    for (auto& slot : slots_) {
        if (slot->worker.joinable()) slot->worker.join();
    }
}

std::chrono::milliseconds Supervisor::backoff_delay(const SupervisorOptions& opts, unsigned failures) {
    auto delay = opts.initial_backoff;
    for (unsigned i = 1; i < failures && delay < opts.max_backoff; ++i) delay *= 2;
    return std::min(delay, opts.max_backoff);
}

std::vector<AgentStatus> Supervisor::status() const {
    std::vector<AgentStatus> out;
    out.reserve(slots_.size());
    for (const auto& slot : slots_) {
        std::lock_guard<std::mutex> lk(slot->m);
        AgentStatus s = slot->status;
        s.events = slot->events.load(std::memory_order_relaxed);
        out.push_back(std::move(s));
    }
    return out;
}

void Supervisor::set_state(Slot& slot, AgentState state) {
    std::lock_guard<std::mutex> lk(slot.m);
    slot.status.state = state;
}

/*
 * Per-agent loop: create -> connect -> stream until the session ends, then
 * back off and retry, until stop or too many consecutive failures.
 */
void Supervisor::run_agent(Slot& slot, std::size_t index) {
    const std::string& name = slot.spec.name;
    unsigned failures = 0;
    std::vector<RawEvent> batch;

    while (!stop_.stop_requested()) {
        set_state(slot, AgentState::Connecting);
        std::string error;
        bool streamed = false;
        Clock::time_point streaming_since{};

        try {
            std::unique_ptr<IAgent> agent = slot.spec.factory();
            if (!agent) throw ConnectionError("factory returned no agent");
            AgentSessionGuard guard(*agent);

            agent->connect(stop_);
            set_state(slot, AgentState::Streaming);
            streamed = true;
            streaming_since = Clock::now();
            log_line("supervisor", name, " streaming");

            while (agent->next(batch, stop_)) {
                for (auto& ev : batch) on_raw_(index, std::move(ev));
                slot.events.fetch_add(batch.size(), std::memory_order_relaxed);
                batch.clear();
            }
        } catch (const ProtocolError& e) {
            error = std::string("protocol error: ") + e.what();
        } catch (const StaleFeedError& e) {
            error = std::string("stale feed: ") + e.what();
        } catch (const ConnectionError& e) {
            error = std::string("connection error: ") + e.what();
        } catch (const std::exception& e) {
            error = std::string("agent error: ") + e.what();
        }
        batch.clear();

        if (stop_.stop_requested()) break;
        if (error.empty()) error = "stream ended";

        if (streamed && Clock::now() - streaming_since >= opts_.stability_window) failures = 0;
        ++failures;

        {
            std::lock_guard<std::mutex> lk(slot.m);
            slot.status.consecutive_failures = failures;
            slot.status.last_error = error;
        }

        if (opts_.max_consecutive_failures != 0 && failures > opts_.max_consecutive_failures) {
            set_state(slot, AgentState::Failed);
            log_line("supervisor", name, " failed permanently after ", failures,
                     " consecutive failures; last: ", error);
            return;
        }

        const auto delay = backoff_delay(opts_, failures);
        {
            std::lock_guard<std::mutex> lk(slot.m);
            slot.status.state = AgentState::Disconnected;
            ++slot.status.restarts;
        }
        log_line("supervisor", name, " disconnected (", error, "); retry ", failures,
                 " in ", delay.count(), " ms");

        if (stop_.wait_for(delay)) break;
    }

    set_state(slot, AgentState::Stopped);
    log_line("supervisor", name, " stopped");
}
