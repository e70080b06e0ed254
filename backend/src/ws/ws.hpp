#pragma once
#include <chrono>
#include <string>

#include "pipeline/stop_signal.hpp"

// wss://host[:port][/target]
struct WsEndpoint
{
    std::string host;
    std::string port{"443"};
    std::string target{"/"};
};

// Throws std::invalid_argument unless `url` is a wss:// URL with a host.
WsEndpoint parse_ws_url(const std::string &url);

// Client websocket session over TLS.
// Every blocking call is bounded by a deadline and polls `stop` in slices of
// at most 200 ms, so shutdown is observed promptly.
//
// NOTE: pointer to Implementation (PIMPL) to hide Boost headers from dependents
class WsSession
{
public:
    WsSession(WsEndpoint endpoint, std::string user_agent);
    ~WsSession();
    // Non-copyable
    WsSession(const WsSession &) = delete;
    WsSession &operator=(const WsSession &) = delete;

    // Resolve + TCP + TLS (with SNI) + websocket handshake within `timeout`.
    // Throws ConnectionError.
    void connect(std::chrono::milliseconds timeout, const StopSignal &stop);

    // Send one text frame. Throws ConnectionError.
    void write(const std::string &text, std::chrono::milliseconds timeout, const StopSignal &stop);

    // Read one frame into `out`. Returns false if `stop` was observed.
    // Throws ConnectionError on transport errors or remote close, StaleFeedError
    // when nothing arrives within `idle`.
    bool read(std::string &out, std::chrono::milliseconds idle, const StopSignal &stop);

    // Graceful close (bounded), then drop the socket. Safe to call twice.
    void close() noexcept;

    const WsEndpoint &endpoint() const;

private:
    struct Impl;
    Impl *impl_;
};
