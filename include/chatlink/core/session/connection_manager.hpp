/**
 * @file connection_manager.hpp
 * @brief Owner of the long-lived chat socket and its state machine.
 *
 * The manager opens the socket, authenticates over it, keeps it alive with
 * heartbeats, reconnects with bounded exponential backoff, decodes inbound
 * frames into typed events and fans them out to subscribers.
 *
 * States: Disconnected -> Connecting -> Connected -> Reconnecting / Failed.
 * Failed is left only by an explicit connect() or disconnect().
 */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "chatlink/core/config/client_options.hpp"
#include "chatlink/core/interfaces/iframe_codec.hpp"
#include "chatlink/core/interfaces/itransport.hpp"
#include "chatlink/core/protocol/events.hpp"
#include "chatlink/core/types.hpp"
#include "chatlink/core/util/observable.hpp"

namespace chatlink {

    using EventCallback = std::function<void(const InboundEvent&)>;

    /**
     * @class ConnectionManager
     * @brief Connection session manager.
     *
     * All methods are thread-safe. Subscriber callbacks run on the manager's
     * worker threads (or on the caller of connect()/disconnect()) and never
     * while an internal lock is held.
     */
    class ConnectionManager {
    public:
        /**
         * @param options Timeouts, heartbeat, reconnect schedule and server url
         * @param factory Source of a fresh transport per connection attempt
         * @param codec Wire codec; JsonFrameCodec when null
         */
        ConnectionManager(ClientOptions options,
                          TransportFactory factory,
                          std::shared_ptr<IFrameCodec> codec = nullptr);

        /**
         * @brief Disconnects and joins every worker.
         */
        ~ConnectionManager();

        ConnectionManager(const ConnectionManager&) = delete;
        ConnectionManager& operator=(const ConnectionManager&) = delete;

        /**
         * @brief Open the socket, authenticate and wait for the acknowledgment.
         *
         * No-op while Connecting, Connected or Reconnecting. From Failed it is
         * the explicit recovery call and resets the attempt counter. Blocks the
         * caller for at most the auth timeout after the socket opens.
         *
         * @param credential Bearer token, kept for re-authentication on reconnect
         *        until disconnect(). An empty credential is sent as is but not
         *        kept, so a later drop goes straight to Failed.
         * @throws ChatError(Transport) if the socket could not be opened
         * @throws ChatError(AuthenticationFailed) on rejection, ack timeout or
         *         loss of the socket during the handshake
         */
        void connect(const std::string& credential);

        /**
         * @brief Tear down the session and go Disconnected.
         *
         * Cancels heartbeat and reconnect waits, closes the socket and joins
         * the workers. Repeat calls are no-ops; the Disconnected event is
         * emitted only by the call that changed the state.
         */
        void disconnect();

        /**
         * @brief Encode and send an outbound intent.
         * @throws ChatError(NotConnected) unless authenticated
         * @throws ChatError(Encoding) if the intent cannot be encoded
         * @throws ChatError(Transport) if the write fails
         */
        void send(const OutboundIntent& intent);

        /**
         * @brief Send a raw text frame.
         * @throws ChatError(NotConnected) unless authenticated
         * @throws ChatError(Transport) if the write fails
         */
        void sendText(std::string_view text);

        ConnectionState state() const;

        /**
         * @brief Observe state changes; the callback first receives the current state.
         */
        [[nodiscard]] Subscription subscribeState(StateCallback cb);

        /**
         * @brief Observe inbound events from now on.
         */
        [[nodiscard]] Subscription subscribe(EventCallback cb);

        uint32_t reconnectAttempts() const;
        bool isAuthenticated() const;

    private:
        struct Impl;
        std::shared_ptr<Impl> pImpl_;
    };

}
