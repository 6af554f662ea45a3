#include <catch2/catch_all.hpp>
#include "chatlink/core/chat/room_session.hpp"
#include "chatlink/core/interfaces/IHistorySource.hpp"
#include "chatlink/core/protocol/json_frame_codec.hpp"
#include "chatlink/core/session/connection_manager.hpp"
#include "chatlink/core/util/thread_pool.hpp"
#include "mock_transport.hpp"

#include <atomic>

using namespace chatlink;
using namespace std::chrono_literals;
using Kind = DeliveryState::Kind;

namespace {
    const LocalUser me{ "u1", "Ann" };

    std::string messageFrame(const std::string& id, const std::string& sender, const std::string& content,
                             const std::string& room = "r1") {
        nlohmann::json j = {
            {"type", "message"}, {"id", id}, {"content", content}, {"senderId", sender},
            {"senderName", sender == me.id ? me.name : "Bob"}, {"chatRoomId", room},
            {"timestamp", "2024-05-01T10:00:00Z"} };
        return j.dump();
    }

    struct Fixture {
        MockServer server;
        ConnectionManager cm{ fastOptions(), server.factory() };
        std::shared_ptr<ThreadPool> pool = std::make_shared<ThreadPool>(1);

        ~Fixture() { pool->join(); }
    };

    struct StaticHistory : IHistorySource {
        std::vector<Message> items;
        std::string askedFor;
        std::vector<Message> fetchMessages(const std::string& roomId) override {
            askedFor = roomId;
            return items;
        }
    };
}

TEST_CASE_METHOD(Fixture, "sent message is delivered once the server echoes it", "[room]") {
    cm.connect("tok");
    auto room = RoomSession::open(cm, pool, "r1", me, 10s);

    auto id = room->send("hello room");
    REQUIRE(id);
    REQUIRE(waitUntil([&] { return room->find(*id)->delivery.is(Kind::Sent); }));

    auto frames = server.last()->writtenOfType("message");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0]["id"] == *id);
    REQUIRE(frames[0]["content"] == "hello room");
    REQUIRE(frames[0]["chatRoomId"] == "r1");

    server.last()->push(messageFrame(*id, me.id, "hello room"));
    REQUIRE(waitUntil([&] { return room->find(*id)->delivery.is(Kind::Delivered); }));
    REQUIRE(room->messages().size() == 1);
    REQUIRE(room->pendingCount() == 0);
}

TEST_CASE_METHOD(Fixture, "sending while offline fails and retry recovers", "[room]") {
    auto room = RoomSession::open(cm, pool, "r1", me, 10s);

    auto id = room->send("queued?");
    REQUIRE(waitUntil([&] { return room->find(*id)->delivery.is(Kind::Failed); }));
    REQUIRE(room->find(*id)->delivery.cause == "Not connected");

    cm.connect("tok");
    REQUIRE(room->retry(*id));
    REQUIRE(waitUntil([&] { return room->find(*id)->delivery.is(Kind::Sent); }));
    REQUIRE(server.last()->writtenOfType("message").size() == 1);
}

TEST_CASE_METHOD(Fixture, "messages from other users and rooms", "[room]") {
    cm.connect("tok");
    auto room = RoomSession::open(cm, pool, "r1", me, 10s);

    std::atomic<int> changes{ 0 };
    auto sub = room->onMessageChange([&](const Message&) { ++changes; });

    server.last()->push(messageFrame("s1", "u2", "hi Ann"));
    server.last()->push(messageFrame("s2", "u2", "wrong room", "r2"));
    server.last()->push(messageFrame("s3", "u2", "still here"));

    REQUIRE(waitUntil([&] { return room->messages().size() == 2; }));
    auto list = room->messages();
    REQUIRE(list[0].id == "s1");
    REQUIRE(list[1].id == "s3");
    REQUIRE(changes == 2);
}

TEST_CASE_METHOD(Fixture, "typing and presence of other users", "[room][typing]") {
    cm.connect("tok");
    auto room = RoomSession::open(cm, pool, "r1", me, 10s);
    auto t = server.last();

    t->push(R"({"type":"typing","userId":"u2","chatRoomId":"r1","isTyping":true})");
    t->push(R"({"type":"typing","userId":"u3","chatRoomId":"r1","isTyping":true})");
    t->push(R"({"type":"typing","userId":"u4","chatRoomId":"r2","isTyping":true})");
    t->push(R"({"type":"typing","userId":"u1","chatRoomId":"r1","isTyping":true})");
    REQUIRE(waitUntil([&] { return room->typingUsers().size() == 2; }));
    REQUIRE(room->typingUsers() == std::vector<std::string>{ "u2", "u3" });

    t->push(R"({"type":"typing","userId":"u2","chatRoomId":"r1","isTyping":false})");
    REQUIRE(waitUntil([&] { return room->typingUsers() == std::vector<std::string>{ "u3" }; }));

    t->push(R"({"type":"status","userId":"u3","isOnline":true})");
    t->push(R"({"type":"status","userId":"u5","isOnline":true})");
    REQUIRE(waitUntil([&] { return room->onlineUsers().size() == 2; }));

    t->push(R"({"type":"status","userId":"u3","isOnline":false})");
    REQUIRE(waitUntil([&] { return room->onlineUsers() == std::vector<std::string>{ "u5" }; }));
    REQUIRE(room->typingUsers().empty());
}

TEST_CASE_METHOD(Fixture, "draft drives the typing signal", "[room][typing]") {
    cm.connect("tok");
    auto room = RoomSession::open(cm, pool, "r1", me, 10s);
    auto t = server.last();

    room->setDraft("h");
    room->setDraft("he");
    REQUIRE(room->draft() == "he");
    REQUIRE(waitUntil([&] { return t->writtenOfType("typing").size() == 1; }));
    REQUIRE(t->writtenOfType("typing")[0]["isTyping"] == true);

    auto id = room->sendDraft();
    REQUIRE(id);
    REQUIRE(room->draft().empty());
    REQUIRE(waitUntil([&] { return t->writtenOfType("typing").size() == 2; }));
    REQUIRE(t->writtenOfType("typing")[1]["isTyping"] == false);
    REQUIRE(t->writtenOfType("typing")[1]["chatRoomId"] == "r1");
    REQUIRE(waitUntil([&] { return t->writtenOfType("message").size() == 1; }));
}

TEST_CASE_METHOD(Fixture, "blank draft is not sent", "[room]") {
    auto room = RoomSession::open(cm, pool, "r1", me, 10s);
    room->setDraft("   ");
    REQUIRE_FALSE(room->sendDraft());
    REQUIRE(room->draft() == "   ");
    REQUIRE(room->messages().empty());
}

TEST_CASE_METHOD(Fixture, "typing stops by itself after the quiet period", "[room][typing]") {
    cm.connect("tok");
    auto room = RoomSession::open(cm, pool, "r1", me, 50ms);
    auto t = server.last();

    room->setDraft("thinking");
    REQUIRE(waitUntil([&] { return t->writtenOfType("typing").size() == 2; }));
    REQUIRE(t->writtenOfType("typing")[1]["isTyping"] == false);
    REQUIRE(room->draft() == "thinking");
}

TEST_CASE_METHOD(Fixture, "history is loaded ahead of live messages", "[room][history]") {
    cm.connect("tok");
    auto room = RoomSession::open(cm, pool, "r1", me, 10s);
    server.last()->push(messageFrame("live", "u2", "now"));
    REQUIRE(waitUntil([&] { return room->messages().size() == 1; }));

    JsonFrameCodec codec;
    StaticHistory history;
    history.items = codec.decodeMessageList("[" + messageFrame("h1", "u2", "earlier") + "," +
                                            messageFrame("live", "u2", "now") + "]");
    REQUIRE(room->seedHistory(history) == 1);
    REQUIRE(history.askedFor == "r1");

    auto list = room->messages();
    REQUIRE(list.size() == 2);
    REQUIRE(list[0].id == "h1");
    REQUIRE(list[1].id == "live");
}

TEST_CASE_METHOD(Fixture, "a closed room stops following the connection", "[room]") {
    cm.connect("tok");
    std::atomic<int> changes{ 0 };
    {
        auto room = RoomSession::open(cm, pool, "r1", me, 10s);
        auto sub = room->onMessageChange([&](const Message&) { ++changes; });
    }
    server.last()->push(messageFrame("s1", "u2", "anyone?"));
    std::this_thread::sleep_for(50ms);
    REQUIRE(changes == 0);
}

TEST_CASE_METHOD(Fixture, "opening a room without a pool is refused", "[room]") {
    REQUIRE(errorCodeOf([&] { (void)RoomSession::open(cm, nullptr, "r1", me); }) == ChatErr::Internal);
}
