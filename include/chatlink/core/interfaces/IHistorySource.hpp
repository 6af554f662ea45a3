/**
 * @file IHistorySource.hpp
 * @brief Collaborator that returns the stored history of a chat room.
 */
#pragma once
#include <string>
#include <vector>

#include "chatlink/core/types.hpp"

namespace chatlink {

    /**
     * @class IHistorySource
     * @brief Fetches past messages of a room, oldest first.
     *
     * Typically backed by GET /chat-rooms/{id}/messages with a bearer token;
     * JsonFrameCodec::decodeMessageList turns that payload into Messages.
     */
    class IHistorySource {
    public:
        virtual ~IHistorySource() = default;

        /**
         * @throws ChatError on failure
         */
        virtual std::vector<Message> fetchMessages(const std::string& roomId) = 0;
    };

}
