#include "chatlink/core/protocol/json_frame_codec.hpp"
#include "chatlink/core/util/error_types.hpp"
#include "chatlink/core/util/logger.hpp"
#include <nlohmann/json.hpp>
#include <format>
#include <initializer_list>
#include <optional>

namespace chatlink {

    using nlohmann::json;

    namespace {

        std::string_view trimLeft(std::string_view s) {
            size_t i = 0;
            while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r' || s[i] == '\n'))
                ++i;
            return s.substr(i);
        }

        std::string_view trim(std::string_view s) {
            s = trimLeft(s);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
                s.remove_suffix(1);
            return s;
        }

        /* first present key wins; numbers are accepted for ids */
        const json* field(const json& obj, std::initializer_list<const char*> keys) {
            for (const char* k : keys) {
                auto it = obj.find(k);
                if (it != obj.end() && !it->is_null())
                    return &*it;
            }
            return nullptr;
        }

        std::optional<std::string> stringField(const json& obj, std::initializer_list<const char*> keys) {
            const json* v = field(obj, keys);
            if (!v || !v->is_string()) return std::nullopt;
            return v->get<std::string>();
        }

        std::optional<std::string> idField(const json& obj, std::initializer_list<const char*> keys) {
            const json* v = field(obj, keys);
            if (!v) return std::nullopt;
            if (v->is_string()) return v->get<std::string>();
            if (v->is_number_integer()) return v->dump();
            return std::nullopt;
        }

        std::optional<bool> boolField(const json& obj, std::initializer_list<const char*> keys) {
            const json* v = field(obj, keys);
            if (!v || !v->is_boolean()) return std::nullopt;
            return v->get<bool>();
        }

        std::optional<Message> parseMessage(const json& obj) {
            if (!obj.is_object()) return std::nullopt;

            auto id      = idField(obj, { "id" });
            auto content = stringField(obj, { "content" });
            auto sender  = idField(obj, { "senderId", "sender_id" });
            auto name    = stringField(obj, { "senderName", "sender_name" });
            auto room    = idField(obj, { "chatRoomId", "chat_room_id" });
            auto stamp   = stringField(obj, { "timestamp" });
            if (!id || !content || !sender || !name || !room || !stamp)
                return std::nullopt;

            auto ts = parseIso8601(*stamp);
            if (!ts) return std::nullopt;

            Message m;
            m.id         = std::move(*id);
            m.content    = std::move(*content);
            m.senderId   = std::move(*sender);
            m.senderName = std::move(*name);
            m.roomId     = std::move(*room);
            m.timestamp  = *ts;
            m.delivery   = DeliveryState::delivered();
            return m;
        }

        DecodedFrame decodeAuth(const json& obj, const std::string& type) {
            auto verdict = boolField(obj, { "authenticated" });
            if (verdict) {
                return AuthResult{ *verdict, stringField(obj, { "message" }).value_or("") };
            }
            if (type == "authenticated")
                return AuthResult{ true, stringField(obj, { "message" }).value_or("") };
            if (type == "connected")
                return ServerHello{};
            return Ignored{ "success frame without an authenticated field" };
        }
    }

    DecodedFrame JsonFrameCodec::decode(std::string_view frame) const {
        std::string_view body = trim(frame);
        if (body == "ping") return PingFrame{};
        if (body == "pong") return PongFrame{};

        if (body.empty() || (body.front() != '{' && body.front() != '['))
            return Ignored{ "non-JSON payload" };

        json obj = json::parse(body.begin(), body.end(), nullptr, false);
        if (obj.is_discarded())
            return Ignored{ "malformed JSON" };
        if (!obj.is_object())
            return Ignored{ "top-level value is not an object" };

        auto typeIt = obj.find("type");
        if (typeIt == obj.end() || !typeIt->is_string())
            return Ignored{ "missing type" };
        const std::string type = typeIt->get<std::string>();

        if (type == "message") {
            auto m = parseMessage(obj);
            if (!m) return Ignored{ "message frame with missing or invalid fields" };
            return InboundEvent{ MessageReceived{ std::move(*m) } };
        }
        if (type == "typing") {
            auto user = idField(obj, { "userId", "user_id" });
            auto room = idField(obj, { "chatRoomId", "chat_room_id" });
            auto on   = boolField(obj, { "isTyping", "is_typing" });
            if (!user || !room || !on) return Ignored{ "typing frame with missing fields" };
            return InboundEvent{ UserTyping{ std::move(*user), std::move(*room), *on } };
        }
        if (type == "status" || type == "userStatus") {
            auto user = idField(obj, { "userId", "user_id" });
            auto on   = boolField(obj, { "isOnline", "is_online" });
            if (!user || !on) return Ignored{ "status frame with missing fields" };
            return InboundEvent{ PresenceChanged{ std::move(*user), *on } };
        }
        if (type == "userRegistered")
            return InboundEvent{ UserRegistered{} };
        if (type == "error")
            return InboundEvent{ ServerError{ stringField(obj, { "message" }).value_or("Unknown server error") } };
        if (type == "ack" || type == "messageSent") {
            auto id = idField(obj, { "messageId", "message_id", "id" });
            if (!id) return Ignored{ "ack frame without message id" };
            return InboundEvent{ MessageAck{ std::move(*id) } };
        }
        if (type == "success" || type == "connected" || type == "authenticated")
            return decodeAuth(obj, type);

        return Ignored{ std::format("unknown type '{}'", type) };
    }

    std::string JsonFrameCodec::encode(const OutboundIntent& intent) const {
        if (std::holds_alternative<PingIntent>(intent))
            return "ping";

        json j;
        if (auto* a = std::get_if<AuthIntent>(&intent)) {
            j = { {"type", "auth"}, {"token", a->token} };
        } else if (auto* m = std::get_if<ChatMessageIntent>(&intent)) {
            j = { {"type", "message"}, {"id", m->id}, {"content", m->content}, {"chatRoomId", m->roomId} };
        } else if (auto* t = std::get_if<TypingIntent>(&intent)) {
            j = { {"type", "typing"}, {"chatRoomId", t->roomId}, {"isTyping", t->isTyping} };
        }

        try {
            return j.dump();
        } catch (const json::exception& ex) {
            throw ChatError(ChatErr::Encoding, std::format("cannot encode frame: {}", ex.what()));
        }
    }

    std::vector<Message> JsonFrameCodec::decodeMessageList(std::string_view payload) const {
        json arr = json::parse(payload.begin(), payload.end(), nullptr, false);
        if (arr.is_discarded() || !arr.is_array())
            throw ChatError(ChatErr::Decoding, "history payload is not a JSON array");

        std::vector<Message> out;
        out.reserve(arr.size());
        for (const auto& item : arr) {
            auto m = parseMessage(item);
            if (!m) {
                LOG_WARN("history entry skipped: missing or invalid fields");
                continue;
            }
            out.push_back(std::move(*m));
        }
        return out;
    }

}
