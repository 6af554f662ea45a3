/**
 * @file error_types.hpp
 * @brief Error type definitions for chatlink.
 *
 * Provides the error code enum and the exception type thrown across the
 * connection, codec, delivery and storage layers.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace chatlink {

    /**
     * @enum ChatErr
     * @brief Error codes for chatlink operations.
     *
     * - Transport: Socket-level failure (open, read, write)
     * - AuthenticationFailed: Handshake not acknowledged in time, or rejected
     * - Encoding: Outbound intent could not be encoded
     * - Decoding: Inbound frame could not be decoded
     * - NotConnected: Send attempted while the session is not authenticated
     * - Storage: Token store I/O failure
     * - Configuration: Invalid client options document
     */
    enum class ChatErr : int {
        Transport = 1,          ///< Socket-level failure
        AuthenticationFailed,   ///< Handshake failed or timed out
        Encoding,               ///< Outbound encode failure
        Decoding,               ///< Inbound decode failure
        NotConnected,           ///< Session not authenticated
        Storage,                ///< Persistence failure
        Configuration,          ///< Invalid options
        Internal = 99           ///< Unexpected internal error
    };

    /**
     * @brief Short stable name of an error code, used in logs.
     */
    inline const char* errName(ChatErr e) {
        switch (e) {
            case ChatErr::Transport:            return "Transport";
            case ChatErr::AuthenticationFailed: return "AuthenticationFailed";
            case ChatErr::Encoding:             return "Encoding";
            case ChatErr::Decoding:             return "Decoding";
            case ChatErr::NotConnected:         return "NotConnected";
            case ChatErr::Storage:              return "Storage";
            case ChatErr::Configuration:        return "Configuration";
            case ChatErr::Internal:             return "Internal";
        }
        return "Unknown";
    }

    /**
     * @class ChatError
     * @brief Exception carrying a ChatErr code and a human readable message.
     */
    class ChatError : public std::runtime_error {
    public:
        ChatError(ChatErr code, const std::string& msg)
            : std::runtime_error(msg), code_(code) {}

        ChatErr code() const noexcept { return code_; }

    private:
        ChatErr code_;
    };

}
