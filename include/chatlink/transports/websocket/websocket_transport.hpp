/**
 * @file websocket_transport.hpp
 * @brief WebSocket client transport for chatlink, built on Boost.Beast.
 *
 * Each instance owns one Beast websocket stream and an I/O thread running its
 * io_context. The blocking ITransport calls post the matching asynchronous
 * Beast operation and wait for its completion, so a close() from any thread
 * cancels whatever read or write is in flight.
 */
#pragma once

#include "chatlink/core/interfaces/itransport.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace chatlink {

    /**
     * @struct ParsedUrl
     * @brief Components of a ws:// URL.
     */
    struct ParsedUrl {
        bool        secure{ false };   ///< true for wss://
        std::string host;
        std::string port;
        std::string path;
    };

    /**
     * @brief Split a ws:// or wss:// URL into host, port and path.
     *
     * The port defaults to 80 (443 for wss) and the path to "/".
     * @return false if the URL is malformed
     */
    bool parseWsUrl(const std::string& url, ParsedUrl& out);

    /**
     * @class WebSocketTransport
     * @brief Single-use ws:// client connection.
     *
     * wss:// URLs are rejected by open().
     */
    class WebSocketTransport : public ITransport {
    public:
        /**
         * @param connectTimeout Limit for resolve + TCP connect + WebSocket upgrade
         * @param maxFrameBytes Largest inbound message accepted
         */
        explicit WebSocketTransport(std::chrono::milliseconds connectTimeout = std::chrono::seconds(10),
                                    uint64_t maxFrameBytes = 1024 * 1024);
        ~WebSocketTransport() override;

        WebSocketTransport(const WebSocketTransport&) = delete;
        WebSocketTransport& operator=(const WebSocketTransport&) = delete;

        void open(const std::string& url) override;
        std::string read() override;
        void write(std::string_view frame) override;
        void close() noexcept override;
        bool isOpen() const override;

        /**
         * @brief Factory producing WebSocketTransport instances with the given settings.
         */
        static TransportFactory factory(std::chrono::milliseconds connectTimeout = std::chrono::seconds(10));

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
