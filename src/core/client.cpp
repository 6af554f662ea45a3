#include "chatlink/core/client.hpp"
#include "chatlink/core/auth/bearer_token.hpp"
#include "chatlink/core/chat/room_session.hpp"
#include "chatlink/core/interfaces/ITokenStore.hpp"
#include "chatlink/core/session/connection_manager.hpp"
#include "chatlink/core/util/error_types.hpp"
#include "chatlink/core/util/logger.hpp"
#include "chatlink/core/util/thread_pool.hpp"
#include <format>
#include <mutex>

namespace chatlink {

    struct ChatClient::Impl {
        Impl(ClientOptions o, std::shared_ptr<ITokenStore> s, TransportFactory f)
            : opts(std::move(o)),
              store(std::move(s)),
              connection(opts, std::move(f)),
              pool(std::make_shared<ThreadPool>(opts.sendWorkers)) {}

        ClientOptions                opts;
        std::shared_ptr<ITokenStore> store;
        ConnectionManager            connection;
        std::shared_ptr<ThreadPool>  pool;

        mutable std::mutex           mx;
        std::optional<LocalUser>     user;

        /* a session that connect() would leave untouched */
        bool sessionLive() const {
            auto st = connection.state();
            return !st.is(ConnectionState::Kind::Disconnected) && !st.is(ConnectionState::Kind::Failed);
        }

        void clearToken() {
            try {
                store->remove(kAuthTokenKey);
            } catch (const ChatError& e) {
                LOG_ERROR(std::format("cannot clear stored token: {}", e.what()));
            }
        }
    };

    ChatClient::ChatClient(ClientOptions options, std::shared_ptr<ITokenStore> store, TransportFactory factory)
    {
        if (!store)
            throw ChatError(ChatErr::Internal, "ChatClient requires a token store");
        Logger::inst().setLevel(options.logLevel);
        pImpl_ = std::make_unique<Impl>(std::move(options), std::move(store), std::move(factory));
    }

    ChatClient::~ChatClient() {
        /* rooms may outlive the client; their queued sends must not reach a destroyed connection */
        pImpl_->pool->join();
    }

    void ChatClient::login(const std::string& token, LocalUser user) {
        if (pImpl_->sessionLive()) {
            LOG_INFO("login on a live session, disconnecting the previous one");
            pImpl_->connection.disconnect();
        }
        try {
            pImpl_->store->set(kAuthTokenKey, token);
        } catch (const ChatError& e) {
            LOG_WARN(std::format("token not persisted: {}", e.what()));
        }
        {
            std::scoped_lock lk(pImpl_->mx);
            pImpl_->user = std::move(user);
        }

        try {
            pImpl_->connection.connect(token);
        } catch (const ChatError& e) {
            if (e.code() == ChatErr::AuthenticationFailed)
                pImpl_->clearToken();
            throw;
        }
    }

    bool ChatClient::resume(std::optional<LocalUser> user) {
        if (pImpl_->sessionLive()) {
            LOG_DEBUG("session already live, resume skipped");
            return pImpl_->connection.isAuthenticated();
        }
        std::optional<std::string> token;
        try {
            token = pImpl_->store->get(kAuthTokenKey);
        } catch (const ChatError& e) {
            LOG_ERROR(std::format("cannot read stored token: {}", e.what()));
            return false;
        }
        if (!token || token->empty()) {
            LOG_DEBUG("no stored token, resume skipped");
            return false;
        }

        auto claims = inspectBearer(*token);
        if (claims && claims->expired(std::chrono::system_clock::now())) {
            LOG_INFO("stored token expired, cleared");
            pImpl_->clearToken();
            return false;
        }

        LocalUser who = user ? *user : (claims ? claims->user() : LocalUser{});
        if (who.empty()) {
            LOG_WARN("stored token carries no user identity, resume skipped");
            return false;
        }
        {
            std::scoped_lock lk(pImpl_->mx);
            pImpl_->user = who;
        }

        try {
            pImpl_->connection.connect(*token);
        } catch (const ChatError& e) {
            if (e.code() == ChatErr::AuthenticationFailed) {
                LOG_WARN(std::format("stored token rejected: {}", e.what()));
                pImpl_->clearToken();
                std::scoped_lock lk(pImpl_->mx);
                pImpl_->user.reset();
            } else {
                LOG_WARN(std::format("resume failed, token kept: {}", e.what()));
            }
            return false;
        }
        return pImpl_->connection.isAuthenticated();
    }

    void ChatClient::logout() {
        pImpl_->connection.disconnect();
        pImpl_->clearToken();
        std::scoped_lock lk(pImpl_->mx);
        pImpl_->user.reset();
    }

    std::optional<LocalUser> ChatClient::currentUser() const {
        std::scoped_lock lk(pImpl_->mx);
        return pImpl_->user;
    }

    std::shared_ptr<RoomSession> ChatClient::openRoom(const std::string& roomId) {
        auto who = currentUser();
        if (!who)
            throw ChatError(ChatErr::NotConnected, "no user logged in");
        return RoomSession::open(pImpl_->connection, pImpl_->pool, roomId, *who, pImpl_->opts.typingQuietPeriod);
    }

    ConnectionManager& ChatClient::connection() {
        return pImpl_->connection;
    }

    const ClientOptions& ChatClient::options() const {
        return pImpl_->opts;
    }

}
