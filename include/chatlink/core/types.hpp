/**
 * @file types.hpp
 * @brief Core value types shared by the chatlink modules.
 */
#pragma once
#include <string>
#include <cstdint>
#include <functional>
#include <utility>

#include "chatlink/core/util/time.hpp"

namespace chatlink {

    /**
     * @struct ConnectionState
     * @brief Current phase of the connection session.
     *
     * Failed carries a human readable reason and is left only by an explicit
     * connect() or disconnect().
     */
    struct ConnectionState {
        enum class Kind : uint8_t { Disconnected, Connecting, Connected, Reconnecting, Failed };

        Kind        kind{ Kind::Disconnected };
        std::string reason;     ///< Only meaningful for Failed

        static ConnectionState disconnected() { return { Kind::Disconnected, {} }; }
        static ConnectionState connecting()   { return { Kind::Connecting, {} }; }
        static ConnectionState connected()    { return { Kind::Connected, {} }; }
        static ConnectionState reconnecting() { return { Kind::Reconnecting, {} }; }
        static ConnectionState failed(std::string why) { return { Kind::Failed, std::move(why) }; }

        bool is(Kind k) const { return kind == k; }

        /// Text for a status banner, e.g. "Reconnecting..." or "Failed: timeout".
        std::string displayText() const {
            switch (kind) {
                case Kind::Disconnected: return "Disconnected";
                case Kind::Connecting:   return "Connecting...";
                case Kind::Connected:    return "Connected";
                case Kind::Reconnecting: return "Reconnecting...";
                case Kind::Failed:       return "Failed: " + reason;
            }
            return "Unknown";
        }

        bool operator==(const ConnectionState&) const = default;
    };

    /**
     * @struct DeliveryState
     * @brief Local delivery status of a chat message. Never transmitted.
     *
     * Sending -> Sent -> Delivered, or Failed(cause) from Sending/Sent.
     * Failed -> Sending happens only on an explicit retry.
     */
    struct DeliveryState {
        enum class Kind : uint8_t { Sending = 0, Sent = 1, Delivered = 2, Failed = 3 };

        Kind        kind{ Kind::Sending };
        std::string cause;      ///< Only meaningful for Failed

        static DeliveryState sending()   { return { Kind::Sending, {} }; }
        static DeliveryState sent()      { return { Kind::Sent, {} }; }
        static DeliveryState delivered() { return { Kind::Delivered, {} }; }
        static DeliveryState failed(std::string why) { return { Kind::Failed, std::move(why) }; }

        bool is(Kind k) const { return kind == k; }
        bool pending() const { return kind == Kind::Sending || kind == Kind::Sent; }

        bool operator==(const DeliveryState&) const = default;
    };

    inline const char* toString(DeliveryState::Kind k) {
        switch (k) {
            case DeliveryState::Kind::Sending:   return "sending";
            case DeliveryState::Kind::Sent:      return "sent";
            case DeliveryState::Kind::Delivered: return "delivered";
            case DeliveryState::Kind::Failed:    return "failed";
        }
        return "unknown";
    }

    /**
     * @struct Message
     * @brief A chat message as held by the client.
     */
    struct Message {
        std::string   id;           ///< Client UUID for local messages, server id otherwise
        std::string   senderId;
        std::string   senderName;
        std::string   content;
        Timestamp     timestamp{};
        std::string   roomId;
        DeliveryState delivery{ DeliveryState::delivered() };
    };

    /**
     * @struct LocalUser
     * @brief The authenticated user of this client.
     */
    struct LocalUser {
        std::string id;
        std::string name;

        bool empty() const { return id.empty(); }
    };

    using StateCallback = std::function<void(const ConnectionState&)>;

}
