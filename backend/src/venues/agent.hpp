#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "md/md_types.hpp"
#include "pipeline/stop_signal.hpp"

// Transient transport failure: resolve, TCP, TLS, websocket handshake,
// subscription write, remote close. Retried with backoff.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed frame or an error reply from the venue. Treated as a disconnect.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No frame within the stale-after window. Treated as a disconnect.
class StaleFeedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One streaming session to one venue feed.
// An agent is single-use: the supervisor recreates it through its factory
// for every reconnect.
struct IAgent {
    virtual ~IAgent() = default;

    virtual const std::string& name() const = 0;
    virtual Venue venue() const = 0;

    // Establish the session and subscribe. Throws ConnectionError.
    virtual void connect(const StopSignal& stop) = 0;

    // Blocks for the next frame and appends the raw events it carried (maybe none).
    // Returns false only when `stop` was observed. Throws ConnectionError,
    // ProtocolError or StaleFeedError when the stream ends.
    virtual bool next(std::vector<RawEvent>& out, const StopSignal& stop) = 0;

    virtual void close() noexcept = 0;
};

using AgentFactory = std::function<std::unique_ptr<IAgent>()>;

// Releases an agent's session on every exit path.
class AgentSessionGuard {
public:
    explicit AgentSessionGuard(IAgent& agent) : agent_(agent) {}
    ~AgentSessionGuard() { agent_.close(); }
    AgentSessionGuard(const AgentSessionGuard&) = delete;
    AgentSessionGuard& operator=(const AgentSessionGuard&) = delete;

private:
    IAgent& agent_;
};
