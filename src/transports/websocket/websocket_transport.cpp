#include "chatlink/transports/websocket/websocket_transport.hpp"
#include "chatlink/core/util/error_types.hpp"
#include "chatlink/core/util/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <cstdlib>
#include <format>
#include <future>
#include <mutex>
#include <thread>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace chatlink {

    bool parseWsUrl(const std::string& url, ParsedUrl& out) {
        out = ParsedUrl{};
        constexpr std::string_view ws = "ws://";
        constexpr std::string_view wss = "wss://";
        size_t pos;
        if (url.compare(0, ws.size(), ws) == 0) {
            out.secure = false;
            pos = ws.size();
        } else if (url.compare(0, wss.size(), wss) == 0) {
            out.secure = true;
            pos = wss.size();
        } else {
            return false;
        }

        size_t slash = url.find('/', pos);
        std::string hostport = (slash == std::string::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
        if (hostport.empty()) return false;

        size_t colon = hostport.rfind(':');
        if (colon != std::string::npos) {
            out.host = hostport.substr(0, colon);
            out.port = hostport.substr(colon + 1);
        } else {
            out.host = hostport;
            out.port = out.secure ? "443" : "80";
        }
        out.path = (slash == std::string::npos) ? "/" : url.substr(slash);

        if (out.host.empty() || out.port.empty()) return false;
        for (char c : out.port)
            if (c < '0' || c > '9') return false;
        unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        return p > 0 && p <= 65535;
    }

    struct WebSocketTransport::Impl {
        Impl(std::chrono::milliseconds timeout, uint64_t maxFrame)
            : connectTimeout(timeout),
              work(net::make_work_guard(ioc)),
              resolver(ioc),
              ws(ioc)
        {
            ws.read_message_max(maxFrame);
            ioThread = std::jthread([this] { ioc.run(); });
        }

        ~Impl() {
            work.reset();
            ioc.stop();
            if (ioThread.joinable()) ioThread.join();
        }

        /* runs fn on the I/O thread and waits for the error code it reports */
        template<class Start>
        beast::error_code await(Start start) {
            std::promise<beast::error_code> done;
            auto fut = done.get_future();
            net::post(ioc, [&] { start(done); });
            return fut.get();
        }

        std::chrono::milliseconds connectTimeout;
        net::io_context ioc;
        net::executor_work_guard<net::io_context::executor_type> work;
        tcp::resolver resolver;
        websocket::stream<beast::tcp_stream> ws;
        beast::flat_buffer buffer;
        std::string hostHeader;
        std::string target;

        std::mutex writeMx;
        std::atomic<bool> opened{ false };
        std::atomic<bool> closed{ false };
        std::jthread ioThread;
    };

    WebSocketTransport::WebSocketTransport(std::chrono::milliseconds connectTimeout, uint64_t maxFrameBytes)
        : pImpl_(std::make_unique<Impl>(connectTimeout, maxFrameBytes)) {}

    WebSocketTransport::~WebSocketTransport() {
        close();
    }

    void WebSocketTransport::open(const std::string& url) {
        ParsedUrl u;
        if (!parseWsUrl(url, u))
            throw ChatError(ChatErr::Transport, std::format("invalid url '{}'", url));
        if (u.secure)
            throw ChatError(ChatErr::Transport, "wss:// is not supported");
        if (pImpl_->closed)
            throw ChatError(ChatErr::Transport, "transport already closed");

        auto& I = *pImpl_;
        I.hostHeader = u.host + ":" + u.port;
        I.target = u.path;

        auto ec = I.await([&I, &u](std::promise<beast::error_code>& done) {
            I.resolver.async_resolve(u.host, u.port,
                [&I, &done](beast::error_code ec, tcp::resolver::results_type results) {
                    if (ec) { done.set_value(ec); return; }
                    beast::get_lowest_layer(I.ws).expires_after(I.connectTimeout);
                    beast::get_lowest_layer(I.ws).async_connect(results,
                        [&I, &done](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                            if (ec) { done.set_value(ec); return; }
                            beast::get_lowest_layer(I.ws).expires_never();
                            auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
                            timeouts.handshake_timeout = I.connectTimeout;   // also bounds the closing handshake
                            I.ws.set_option(timeouts);
                            I.ws.set_option(websocket::stream_base::decorator(
                                [](websocket::request_type& req) {
                                    req.set(beast::http::field::user_agent,
                                            std::string(BOOST_BEAST_VERSION_STRING) + " chatlink");
                                }));
                            I.ws.async_handshake(I.hostHeader, I.target,
                                [&done](beast::error_code ec) { done.set_value(ec); });
                        });
                });
        });

        if (ec)
            throw ChatError(ChatErr::Transport, std::format("connect to {} failed: {}", url, ec.message()));
        if (I.closed)
            throw ChatError(ChatErr::Transport, "transport closed while opening");

        I.ws.text(true);
        I.opened = true;
        LOG_DEBUG(std::format("websocket open: {}", url));
    }

    std::string WebSocketTransport::read() {
        auto& I = *pImpl_;
        if (!I.opened || I.closed)
            throw ChatError(ChatErr::Transport, "transport not open");

        I.buffer.consume(I.buffer.size());
        auto ec = I.await([&I](std::promise<beast::error_code>& done) {
            I.ws.async_read(I.buffer, [&done](beast::error_code ec, std::size_t) {
                done.set_value(ec);
            });
        });

        if (ec == websocket::error::closed)
            throw ChatError(ChatErr::Transport, "connection closed by peer");
        if (ec)
            throw ChatError(ChatErr::Transport, std::format("read failed: {}", ec.message()));
        return beast::buffers_to_string(I.buffer.data());
    }

    void WebSocketTransport::write(std::string_view frame) {
        auto& I = *pImpl_;
        std::scoped_lock lk(I.writeMx);
        if (!I.opened || I.closed)
            throw ChatError(ChatErr::Transport, "transport not open");

        auto ec = I.await([&I, frame](std::promise<beast::error_code>& done) {
            I.ws.async_write(net::buffer(frame.data(), frame.size()),
                [&done](beast::error_code ec, std::size_t) { done.set_value(ec); });
        });
        if (ec)
            throw ChatError(ChatErr::Transport, std::format("write failed: {}", ec.message()));
    }

    void WebSocketTransport::close() noexcept {
        auto& I = *pImpl_;
        if (I.closed.exchange(true)) return;

        /* a graceful close frame must not overlap a write; a busy writer gets a hard close */
        std::unique_lock lk(I.writeMx, std::try_to_lock);
        bool graceful = lk.owns_lock() && I.opened;

        net::post(I.ioc, [&I, graceful] {
            beast::error_code ignored;
            I.resolver.cancel();
            if (graceful && I.ws.is_open()) {
                I.ws.async_close(websocket::close_code::normal, [&I](beast::error_code ec) {
                    if (ec) LOG_DEBUG(std::format("websocket close: {}", ec.message()));
                    beast::error_code e;
                    beast::get_lowest_layer(I.ws).socket().close(e);
                });
            } else {
                beast::get_lowest_layer(I.ws).socket().close(ignored);
            }
        });
    }

    bool WebSocketTransport::isOpen() const {
        return pImpl_->opened && !pImpl_->closed;
    }

    TransportFactory WebSocketTransport::factory(std::chrono::milliseconds connectTimeout) {
        return [connectTimeout] { return std::make_shared<WebSocketTransport>(connectTimeout); };
    }

}
