/**
 * @file itransport.hpp
 * @brief Interface for client transport layers in chatlink.
 *
 * A transport is one socket connection carrying UTF-8 text frames. Instances
 * are single-use: the connection manager obtains a fresh one from a
 * TransportFactory for every connection attempt.
 */
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace chatlink {

    /**
     * @class ITransport
     * @brief Blocking text-frame socket.
     *
     * read() is called from exactly one thread. write() may be called from any
     * thread; implementations serialize writes so one frame completes before
     * the next begins. close() may be called from any thread and must unblock a
     * pending read().
     */
    class ITransport {
    public:
        virtual ~ITransport() = default;

        /**
         * @brief Establish the connection.
         * @param url Endpoint, e.g. ws://host:port/path
         * @throws ChatError(Transport) on resolve, connect or handshake failure
         */
        virtual void open(const std::string& url) = 0;

        /**
         * @brief Block until the next text frame arrives.
         * @throws ChatError(Transport) when the connection fails or is closed
         */
        virtual std::string read() = 0;

        /**
         * @brief Send one text frame.
         * @throws ChatError(Transport) on failure or when not open
         */
        virtual void write(std::string_view frame) = 0;

        /**
         * @brief Close the connection. Idempotent.
         */
        virtual void close() noexcept = 0;

        virtual bool isOpen() const = 0;
    };

    /**
     * @typedef TransportFactory
     * @brief Produces a fresh, unopened transport for each connection attempt.
     */
    using TransportFactory = std::function<std::shared_ptr<ITransport>()>;

}
