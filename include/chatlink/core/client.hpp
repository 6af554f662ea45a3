/**
 * @file client.hpp
 * @brief ChatClient: the application-wide entry point of chatlink.
 *
 * Owns the single ConnectionManager, the worker pool for outbound traffic and
 * the bearer-token store. Construct one at startup and pass it to whatever
 * needs the connection.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>

#include "chatlink/core/config/client_options.hpp"
#include "chatlink/core/interfaces/itransport.hpp"
#include "chatlink/core/types.hpp"

namespace chatlink {

    class ConnectionManager;
    class ITokenStore;
    class RoomSession;
    class ThreadPool;

    /**
     * @class ChatClient
     * @brief Login, silent resume and logout around one chat connection.
     */
    class ChatClient {
    public:
        /**
         * @param options Client configuration
         * @param store Where the bearer token is kept between runs
         * @param factory Transport source for the connection manager
         */
        ChatClient(ClientOptions options, std::shared_ptr<ITokenStore> store, TransportFactory factory);

        /**
         * @brief Stops the worker pool, then disconnects.
         */
        ~ChatClient();

        ChatClient(const ChatClient&) = delete;
        ChatClient& operator=(const ChatClient&) = delete;

        /**
         * @brief Persist a freshly issued token and connect with it.
         *
         * A live session is disconnected first so the socket never stays
         * authenticated as a previous user. A rejected token is removed from
         * the store again.
         * @throws ChatError(Transport) or ChatError(AuthenticationFailed) from connect
         */
        void login(const std::string& token, LocalUser user);

        /**
         * @brief Reconnect with the stored token, if any.
         *
         * An expired or rejected token is cleared. A transport failure leaves it
         * in place for the next attempt. On a live session nothing changes.
         * @param user Identity to use; taken from the token's claims when absent
         * @return true when the session is authenticated
         */
        bool resume(std::optional<LocalUser> user = std::nullopt);

        /**
         * @brief Disconnect, clear the stored token and forget the user.
         */
        void logout();

        std::optional<LocalUser> currentUser() const;

        /**
         * @brief Open a room session for the current user.
         * @throws ChatError(NotConnected) if nobody is logged in
         */
        std::shared_ptr<RoomSession> openRoom(const std::string& roomId);

        ConnectionManager& connection();
        const ClientOptions& options() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
