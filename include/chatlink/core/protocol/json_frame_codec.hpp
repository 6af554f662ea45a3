/**
 * @file json_frame_codec.hpp
 * @brief JSON implementation of IFrameCodec.
 *
 * Frames are JSON objects discriminated by a string `type` field, with the
 * literals `ping` and `pong` as keepalives.
 */
#pragma once
#include "chatlink/core/interfaces/iframe_codec.hpp"

namespace chatlink {

    /**
     * @class JsonFrameCodec
     * @brief nlohmann/json based wire codec.
     *
     * Message fields are accepted in camelCase or snake_case. Timestamps are
     * ISO-8601 with optional fraction and offset.
     */
    class JsonFrameCodec : public IFrameCodec {
    public:
        DecodedFrame decode(std::string_view frame) const override;

        std::string encode(const OutboundIntent& intent) const override;

        std::vector<Message> decodeMessageList(std::string_view payload) const override;
    };

}
