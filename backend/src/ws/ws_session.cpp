#include "ws.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

#include "venues/agent.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace
{
// Longest uninterrupted run of the io_context before `stop` is checked again.
constexpr std::chrono::milliseconds kPollSlice{200};
constexpr std::chrono::milliseconds kCloseTimeout{1000};
} // namespace

WsEndpoint parse_ws_url(const std::string &url)
{
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0)
        throw std::invalid_argument("websocket url must start with wss://: '" + url + "'");

    WsEndpoint ep;
    std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    if (slash != std::string::npos)
    {
        ep.target = rest.substr(slash);
        rest.resize(slash);
    }
    const auto colon = rest.rfind(':');
    if (colon != std::string::npos)
    {
        ep.port = rest.substr(colon + 1);
        rest.resize(colon);
        if (ep.port.empty() || !std::all_of(ep.port.begin(), ep.port.end(), [](char c) { return c >= '0' && c <= '9'; }))
            throw std::invalid_argument("bad port in websocket url '" + url + "'");
    }
    if (rest.empty()) throw std::invalid_argument("missing host in websocket url '" + url + "'");
    ep.host = rest;
    return ep;
}

struct WsSession::Impl
{
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    WsEndpoint ep;
    std::string user_agent;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};
    std::unique_ptr<Stream> ws;
    beast::flat_buffer buffer;

    Impl(WsEndpoint endpoint, std::string agent)
    : ep(std::move(endpoint)), user_agent(std::move(agent))
    {
        // Recommended client settings
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    // Runs the io_context until `done`, the deadline, or a stop request.
    // Returns true only if the operation completed.
    bool run_until(const bool &done, Clock::time_point deadline, const StopSignal *stop)
    {
        while (!done)
        {
            if (stop && stop->stop_requested()) return false;
            const auto now = Clock::now();
            if (now >= deadline) return false;
            const auto slice = std::min<Clock::duration>(deadline - now, kPollSlice);
            ioc.restart();
            ioc.run_for(slice);
        }
        return true;
    }

    // Abort whatever is in flight and let its handler run, so no handler
    // outlives the locals it captured.
    void abort_pending(const bool &done)
    {
        if (ws)
        {
            beast::error_code ec;
            beast::get_lowest_layer(*ws).socket().close(ec);
        }
        while (!done)
        {
            ioc.restart();
            if (ioc.run_one() == 0) break;
        }
    }

    // Starts an async operation through `initiate` and waits for it.
    template <typename Initiate>
    void await(const char *what, Clock::time_point deadline, const StopSignal &stop, Initiate &&initiate)
    {
        beast::error_code ec;
        bool done = false;
        initiate([&](beast::error_code e, auto &&...) {
            ec = e;
            done = true;
        });
        if (!run_until(done, deadline, &stop))
        {
            const bool stopping = stop.stop_requested();
            abort_pending(done);
            throw ConnectionError(std::string(what) + (stopping ? " cancelled by shutdown" : " timed out"));
        }
        if (ec) throw ConnectionError(std::string(what) + ": " + ec.message());
    }

    void connect(std::chrono::milliseconds timeout, const StopSignal &stop)
    {
        const auto deadline = Clock::now() + timeout;
        close();

        // Resolve
        tcp::resolver resolver{ioc};
        tcp::resolver::results_type results;
        {
            beast::error_code ec;
            bool done = false;
            resolver.async_resolve(ep.host, ep.port, [&](beast::error_code e, tcp::resolver::results_type r) {
                ec = e;
                results = std::move(r);
                done = true;
            });
            if (!run_until(done, deadline, &stop))
            {
                const bool stopping = stop.stop_requested();
                resolver.cancel();
                abort_pending(done);
                throw ConnectionError(std::string("resolve ") + ep.host + (stopping ? " cancelled by shutdown" : " timed out"));
            }
            if (ec) throw ConnectionError("resolve " + ep.host + ": " + ec.message());
        }

        // Make the socket + SSL + WS stack
        ws = std::make_unique<Stream>(ioc, ssl_ctx);

        // TCP connect
        await("tcp connect", deadline, stop, [&](auto handler) {
            beast::get_lowest_layer(*ws).async_connect(results, std::move(handler));
        });

        // SNI (Server Name Indication) for TLS
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), ep.host.c_str()))
        {
            throw ConnectionError(
                "SNI set failed: " +
                beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()).message());
        }

        // SSL handshake
        await("tls handshake", deadline, stop, [&](auto handler) {
            ws->next_layer().async_handshake(net::ssl::stream_base::client, std::move(handler));
        });

        // WS handshake
        ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws->set_option(websocket::stream_base::decorator([ua = user_agent](websocket::request_type &req) {
            req.set(http::field::user_agent, ua);
        }));
        const std::string host_header = ep.port == "443" ? ep.host : ep.host + ":" + ep.port;
        await("websocket handshake", deadline, stop, [&](auto handler) {
            ws->async_handshake(host_header, ep.target, std::move(handler));
        });
    }

    void write(const std::string &text, std::chrono::milliseconds timeout, const StopSignal &stop)
    {
        if (!ws) throw ConnectionError("write on a closed session");
        ws->text(true);
        await("write", Clock::now() + timeout, stop, [&](auto handler) {
            ws->async_write(net::buffer(text), std::move(handler));
        });
    }

    bool read(std::string &out, std::chrono::milliseconds idle, const StopSignal &stop)
    {
        if (!ws) throw ConnectionError("read on a closed session");
        buffer.clear();

        beast::error_code ec;
        bool done = false;
        ws->async_read(buffer, [&](beast::error_code e, std::size_t) {
            ec = e;
            done = true;
        });
        if (!run_until(done, Clock::now() + idle, &stop))
        {
            const bool stopping = stop.stop_requested();
            abort_pending(done);
            ws.reset();
            if (stopping) return false;
            throw StaleFeedError("no frame from " + ep.host + " for " + std::to_string(idle.count()) + " ms");
        }
        if (ec)
        {
            ws.reset();
            if (ec == websocket::error::closed)
                throw ConnectionError("closed by " + ep.host);
            throw ConnectionError("read from " + ep.host + ": " + ec.message());
        }
        out = beast::buffers_to_string(buffer.cdata());
        return true;
    }

    void close() noexcept
    {
        if (!ws) return;
        if (ws->is_open())
        {
            bool done = false;
            ws->async_close(websocket::close_code::normal, [&](beast::error_code) { done = true; });
            if (!run_until(done, Clock::now() + kCloseTimeout, nullptr))
                abort_pending(done);
        }
        beast::error_code ec;
        beast::get_lowest_layer(*ws).socket().close(ec);
        ws.reset();
    }
};

WsSession::WsSession(WsEndpoint endpoint, std::string user_agent)
: impl_(new Impl(std::move(endpoint), std::move(user_agent))) {}
WsSession::~WsSession()
{
    impl_->close();
    delete impl_;
}

// The outer class methods just forward to the implementation
void WsSession::connect(std::chrono::milliseconds timeout, const StopSignal &stop) { impl_->connect(timeout, stop); }
void WsSession::write(const std::string &text, std::chrono::milliseconds timeout, const StopSignal &stop)
{
    impl_->write(text, timeout, stop);
}
bool WsSession::read(std::string &out, std::chrono::milliseconds idle, const StopSignal &stop)
{
    return impl_->read(out, idle, stop);
}
void WsSession::close() noexcept { impl_->close(); }
const WsEndpoint &WsSession::endpoint() const { return impl_->ep; }
