/**
 * @file room_session.hpp
 * @brief Per-room view of the chat connection.
 *
 * A RoomSession owns the delivery tracker and typing debouncer of one room,
 * follows the connection's event stream for as long as it lives, and keeps
 * the remote typing set, the online set and the compose buffer.
 */
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chatlink/core/types.hpp"
#include "chatlink/core/util/observable.hpp"

namespace chatlink {

    class ConnectionManager;
    class IHistorySource;
    class ThreadPool;

    /**
     * @class RoomSession
     * @brief Chat room consumer of a ConnectionManager.
     *
     * Must not outlive the ConnectionManager it was opened on. Outbound
     * messages and typing signals go through the shared worker pool.
     */
    class RoomSession : public std::enable_shared_from_this<RoomSession> {
    public:
        /**
         * @brief Open a session on a room and start following the event stream.
         * @param conn Connection the room's traffic flows through
         * @param pool Worker pool for sends
         * @param roomId Room identifier
         * @param me Authenticated user; used to author messages and to recognize echoes
         * @param typingQuiet Quiet period after which typing stops
         */
        static std::shared_ptr<RoomSession> open(ConnectionManager& conn,
                                                 std::shared_ptr<ThreadPool> pool,
                                                 std::string roomId,
                                                 LocalUser me,
                                                 std::chrono::milliseconds typingQuiet = std::chrono::seconds(2));
        ~RoomSession();

        RoomSession(const RoomSession&) = delete;
        RoomSession& operator=(const RoomSession&) = delete;

        const std::string& roomId() const;

        /**
         * @brief Replace the compose buffer and feed the typing debouncer.
         */
        void setDraft(std::string text);
        std::string draft() const;

        /**
         * @brief Submit the compose buffer, clear it and stop typing.
         * @return Id of the new message, or std::nullopt if the draft was blank
         */
        std::optional<std::string> sendDraft();

        /**
         * @brief Submit a message without touching the compose buffer.
         */
        std::optional<std::string> send(const std::string& content);

        bool retry(const std::string& messageId);

        std::vector<Message> messages() const;
        std::optional<Message> find(const std::string& messageId) const;
        size_t pendingCount() const;

        /// Remote users currently typing in this room, sorted.
        std::vector<std::string> typingUsers() const;
        /// Users reported online, sorted.
        std::vector<std::string> onlineUsers() const;

        /**
         * @brief Load past messages from the history collaborator.
         * @return Number of messages added
         * @throws ChatError propagated from the source
         */
        size_t seedHistory(IHistorySource& source);

        /**
         * @brief Observe message additions and delivery-state changes.
         */
        [[nodiscard]] Subscription onMessageChange(std::function<void(const Message&)> cb);

    private:
        struct Impl;
        explicit RoomSession(std::unique_ptr<Impl> impl);
        std::unique_ptr<Impl> pImpl_;
    };

}
