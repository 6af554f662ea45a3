/**
 * @file client_options.hpp
 * @brief Tunables of the chat client, with defaults and JSON loading.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "chatlink/core/interfaces/IBackoffStrategy.hpp"
#include "chatlink/core/util/logger.hpp"

namespace chatlink {

    /**
     * @struct ClientOptions
     * @brief Configuration for the connection manager, room sessions and the client facade.
     *
     * JSON keys use the member names; durations are integers in milliseconds:
     * @code{.json}
     * {
     *   "url": "ws://127.0.0.1:8080/ws",
     *   "authTimeoutMs": 5000,
     *   "heartbeatIntervalMs": 30000,
     *   "reconnectBaseDelayMs": 2000,
     *   "reconnectMaxDelayMs": 30000,
     *   "maxReconnectAttempts": 5,
     *   "typingQuietPeriodMs": 2000,
     *   "sendWorkers": 1,
     *   "tokenStorePath": "chatlink_tokens.msgpack",
     *   "logLevel": "info"
     * }
     * @endcode
     * Absent keys keep their defaults.
     */
    struct ClientOptions {
        std::string               url{ "ws://127.0.0.1:8080/ws" };
        std::chrono::milliseconds authTimeout{ 5000 };
        std::chrono::milliseconds heartbeatInterval{ 30000 };
        std::chrono::milliseconds reconnectBaseDelay{ 2000 };
        std::chrono::milliseconds reconnectMaxDelay{ 30000 };
        uint32_t                  maxReconnectAttempts{ 5 };
        std::chrono::milliseconds typingQuietPeriod{ 2000 };
        size_t                    sendWorkers{ 1 };     ///< >1 gives up submit-order on the wire
        std::string               tokenStorePath{ "chatlink_tokens.msgpack" };
        LogLevel                  logLevel{ LogLevel::Info };

        /// Overrides the exponential schedule built from the two delays above.
        std::shared_ptr<IBackoffStrategy> backoff;

        /**
         * @brief The configured strategy, or ExponentialBackoff(base, max) when unset.
         */
        std::shared_ptr<IBackoffStrategy> backoffStrategy() const;

        /**
         * @brief Parse options from a JSON document.
         * @throws ChatError(Configuration) on malformed JSON or ill-typed values
         */
        static ClientOptions fromJson(std::string_view text);

        /**
         * @brief Read and parse a JSON options file.
         * @throws ChatError(Configuration) if the file cannot be read or parsed
         */
        static ClientOptions fromFile(const std::string& path);
    };

}
