/**
 * @file delivery_tracker.hpp
 * @brief Optimistic send / acknowledge / fail lifecycle of outbound chat messages.
 */
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chatlink/core/protocol/events.hpp"
#include "chatlink/core/types.hpp"
#include "chatlink/core/util/observable.hpp"

namespace chatlink {

    class ThreadPool;

    /**
     * @class DeliveryTracker
     * @brief Ordered message list of one chat room with per-message delivery state.
     *
     * Local messages appear immediately in Sending and are sent on the worker
     * pool. A successful write moves them to Sent; a MessageAck or the server's
     * echo of the message moves them to Delivered; a send error moves them to
     * Failed, where they stay visible until retried. States never move
     * backwards, so a late write completion cannot undo a delivery.
     *
     * Every entry has a unique id. Messages of other rooms are ignored.
     */
    class DeliveryTracker {
    public:
        /// Performs the network send; throws ChatError on failure.
        using Sender = std::function<void(const ChatMessageIntent&)>;
        using ChangeCallback = std::function<void(const Message&)>;

        DeliveryTracker(std::string roomId, LocalUser user, Sender sender, std::shared_ptr<ThreadPool> pool);
        ~DeliveryTracker();

        DeliveryTracker(const DeliveryTracker&) = delete;
        DeliveryTracker& operator=(const DeliveryTracker&) = delete;

        /**
         * @brief Append a local message in Sending and queue its send.
         * @return The generated message id, or std::nullopt for blank content
         */
        std::optional<std::string> submit(const std::string& content);

        /**
         * @brief Re-send a Failed message with the same id.
         * @return false if no such message or it is not Failed
         */
        bool retry(const std::string& id);

        /**
         * @brief Reconcile with an inbound event (acks and message echoes).
         */
        void onEvent(const InboundEvent& ev);

        /**
         * @brief Insert past messages ahead of the live ones, skipping known ids.
         * @return Number of messages inserted
         */
        size_t seedHistory(const std::vector<Message>& history);

        std::vector<Message> messages() const;
        std::optional<Message> find(const std::string& id) const;
        size_t pendingCount() const;

        /**
         * @brief Observe added and updated entries.
         */
        [[nodiscard]] Subscription onChange(ChangeCallback cb);

        const std::string& roomId() const { return roomId_; }

    private:
        struct State;
        std::string roomId_;
        LocalUser user_;
        std::shared_ptr<State> st_;
    };

}
