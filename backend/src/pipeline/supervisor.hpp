#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "md/md_types.hpp"
#include "pipeline/stop_signal.hpp"
#include "venues/agent.hpp"

enum class AgentState {
    Connecting,
    Streaming,
    Disconnected,
    Failed,  // gave up after too many consecutive failures
    Stopped, // cooperative shutdown
};

const char* to_string(AgentState s) noexcept;

struct SupervisorOptions {
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{60000};
    // A session that streamed at least this long resets the failure count.
    std::chrono::milliseconds stability_window{30000};
    // Failed once consecutive failures exceed this. 0 retries forever.
    unsigned max_consecutive_failures{10};
};

struct AgentSpec {
    std::string name;
    AgentFactory factory;
};

struct AgentStatus {
    std::string name;
    AgentState state{AgentState::Connecting};
    unsigned consecutive_failures{0};
    std::uint64_t restarts{0};
    std::uint64_t events{0};
    std::string last_error;
};

// Runs every agent on its own thread with its own retry loop.
// One agent failing, stalling or giving up never affects the others.
class Supervisor {
public:
    // Called on the agent's thread for every raw event it produced.
    using RawHandler = std::function<void(std::size_t agent_index, RawEvent&& ev)>;

    Supervisor(std::vector<AgentSpec> agents, SupervisorOptions opts, RawHandler on_raw);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    void start();
    // Requests stop and joins every agent thread. Idempotent.
    void stop();

    const StopSignal& stop_signal() const noexcept { return stop_; }
    std::size_t size() const noexcept { return slots_.size(); }
    std::vector<AgentStatus> status() const;

    // Delay before the retry that follows the `failures`-th consecutive failure (1-based).
    static std::chrono::milliseconds backoff_delay(const SupervisorOptions& opts, unsigned failures);

private:
    struct Slot {
        AgentSpec spec;
        std::thread worker;
        mutable std::mutex m;
        AgentStatus status;
        std::atomic<std::uint64_t> events{0};
    };

    void run_agent(Slot& slot, std::size_t index);
    void set_state(Slot& slot, AgentState state);

    std::vector<std::unique_ptr<Slot>> slots_;
    SupervisorOptions opts_;
    RawHandler on_raw_;
    StopSignal stop_;
    std::mutex lifecycle_m_;
    bool started_{false};
    bool joined_{false};
};
