/**
 * @file events.hpp
 * @brief Typed inbound events and outbound intents of the chat wire protocol.
 *
 * Inbound frames are decoded once, in the codec, into a closed set of event
 * types. Consumers pattern-match with std::visit or std::get_if and never see
 * raw JSON.
 */
#pragma once
#include <string>
#include <variant>

#include "chatlink/core/types.hpp"

namespace chatlink {

    /*──────────── inbound events (fan-out to subscribers) ────────────*/

    struct MessageReceived  { Message message; };
    struct MessageAck       { std::string messageId; };
    struct UserTyping       { std::string userId; std::string roomId; bool isTyping{ false }; };
    struct PresenceChanged  { std::string userId; bool isOnline{ false }; };
    struct UserRegistered   {};
    struct ServerError      { std::string text; };
    struct SessionConnected    {};   ///< Emitted by the manager after a successful handshake
    struct SessionDisconnected {};   ///< Emitted by the manager on an explicit disconnect

    using InboundEvent = std::variant<
        MessageReceived,
        MessageAck,
        UserTyping,
        PresenceChanged,
        UserRegistered,
        ServerError,
        SessionConnected,
        SessionDisconnected>;

    /*──────────── codec-level outcomes (consumed by the manager) ────────────*/

    /// Reply to the auth frame.
    struct AuthResult   { bool accepted{ false }; std::string reason; };
    /// Literal "ping" from the server; the manager answers "pong".
    struct PingFrame    {};
    /// Literal "pong"; keepalive reply, no event.
    struct PongFrame    {};
    /// "connected" greeting without an auth verdict.
    struct ServerHello  {};
    /// Frame dropped as a diagnostic (malformed, unknown type, non-JSON).
    struct Ignored      { std::string why; };

    using DecodedFrame = std::variant<
        Ignored,
        PingFrame,
        PongFrame,
        ServerHello,
        AuthResult,
        InboundEvent>;

    /*──────────── outbound intents ────────────*/

    struct AuthIntent        { std::string token; };
    struct ChatMessageIntent { std::string id; std::string content; std::string roomId; };
    struct TypingIntent      { std::string roomId; bool isTyping{ false }; };
    struct PingIntent        {};

    using OutboundIntent = std::variant<
        AuthIntent,
        ChatMessageIntent,
        TypingIntent,
        PingIntent>;

    /// Short name of an event alternative, for logs.
    inline const char* eventName(const InboundEvent& ev) {
        static constexpr const char* names[]{
            "MessageReceived", "MessageAck", "UserTyping", "PresenceChanged",
            "UserRegistered", "ServerError", "Connected", "Disconnected" };
        return names[ev.index()];
    }

}
