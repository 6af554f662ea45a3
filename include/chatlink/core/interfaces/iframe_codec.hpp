/**
 * @file iframe_codec.hpp
 * @brief Interface for the chat wire codec.
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "chatlink/core/protocol/events.hpp"

namespace chatlink {

    /**
     * @class IFrameCodec
     * @brief Stateless translation between text frames and typed events / intents.
     *
     * decode() never throws: anything it cannot make sense of is an Ignored outcome.
     */
    class IFrameCodec {
    public:
        virtual ~IFrameCodec() = default;

        /**
         * @brief Decode one inbound text frame.
         * @param frame Raw UTF-8 payload
         */
        virtual DecodedFrame decode(std::string_view frame) const = 0;

        /**
         * @brief Encode an outbound intent as a text frame.
         * @throws ChatError(Encoding) if the intent cannot be represented
         */
        virtual std::string encode(const OutboundIntent& intent) const = 0;

        /**
         * @brief Decode a history payload (array of messages) into Delivered messages.
         *
         * Malformed elements are skipped.
         * @throws ChatError(Decoding) if the payload is not an array
         */
        virtual std::vector<Message> decodeMessageList(std::string_view payload) const = 0;
    };

}
