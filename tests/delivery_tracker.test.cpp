#include <catch2/catch_all.hpp>
#include "chatlink/core/chat/delivery_tracker.hpp"
#include "chatlink/core/util/thread_pool.hpp"
#include "mock_transport.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace chatlink;
using Kind = DeliveryState::Kind;

namespace {
    const LocalUser me{ "u1", "Ann" };

    Message incoming(std::string id, std::string sender, std::string content, std::string room = "r1") {
        Message m;
        m.id = std::move(id);
        m.senderId = sender;
        m.senderName = sender == me.id ? me.name : "Other";
        m.content = std::move(content);
        m.roomId = std::move(room);
        m.timestamp = std::chrono::system_clock::now();
        return m;
    }

    /* sender that records intents and fails on demand */
    struct FakeWire {
        std::mutex mx;
        std::vector<ChatMessageIntent> sent;
        std::atomic<bool> failing{ false };

        DeliveryTracker::Sender sender() {
            return [this](const ChatMessageIntent& i) {
                if (failing) throw ChatError(ChatErr::NotConnected, "Not connected");
                std::scoped_lock lk(mx);
                sent.push_back(i);
            };
        }

        size_t count() {
            std::scoped_lock lk(mx);
            return sent.size();
        }
    };

    Kind kindOf(const DeliveryTracker& t, const std::string& id) {
        auto m = t.find(id);
        REQUIRE(m);
        return m->delivery.kind;
    }
}

TEST_CASE("submitted message goes Sending, Sent, Delivered", "[delivery]") {
    FakeWire wire;
    auto pool = std::make_shared<ThreadPool>(1);
    DeliveryTracker tracker("r1", me, wire.sender(), pool);

    std::mutex mx;
    std::vector<Kind> seen;
    auto sub = tracker.onChange([&](const Message& m) {
        std::scoped_lock lk(mx);
        seen.push_back(m.delivery.kind);
    });

    auto id = tracker.submit("hello");
    REQUIRE(id);
    REQUIRE(waitUntil([&] { return kindOf(tracker, *id) == Kind::Sent; }));
    REQUIRE(wire.count() == 1);
    REQUIRE(wire.sent[0].id == *id);
    REQUIRE(wire.sent[0].content == "hello");
    REQUIRE(wire.sent[0].roomId == "r1");
    REQUIRE(tracker.pendingCount() == 1);

    tracker.onEvent(MessageReceived{ incoming(*id, me.id, "hello") });

    REQUIRE(kindOf(tracker, *id) == Kind::Delivered);
    REQUIRE(tracker.messages().size() == 1);
    REQUIRE(tracker.pendingCount() == 0);

    std::scoped_lock lk(mx);
    REQUIRE(seen == std::vector<Kind>{ Kind::Sending, Kind::Sent, Kind::Delivered });
}

TEST_CASE("submitted message is authored by the local user", "[delivery]") {
    FakeWire wire;
    DeliveryTracker tracker("r1", me, wire.sender(), std::make_shared<ThreadPool>(1));
    auto id = tracker.submit("hi");
    auto m = tracker.find(*id);
    REQUIRE(m);
    REQUIRE(m->senderId == "u1");
    REQUIRE(m->senderName == "Ann");
    REQUIRE(m->roomId == "r1");
    REQUIRE(m->id.size() == 36);
}

TEST_CASE("blank content is rejected", "[delivery]") {
    FakeWire wire;
    DeliveryTracker tracker("r1", me, wire.sender(), std::make_shared<ThreadPool>(1));
    REQUIRE_FALSE(tracker.submit(""));
    REQUIRE_FALSE(tracker.submit("  \n\t"));
    REQUIRE(tracker.messages().empty());
}

TEST_CASE("send error marks the message Failed and retry resends it", "[delivery]") {
    FakeWire wire;
    wire.failing = true;
    DeliveryTracker tracker("r1", me, wire.sender(), std::make_shared<ThreadPool>(1));

    auto id = tracker.submit("hello");
    REQUIRE(waitUntil([&] { return kindOf(tracker, *id) == Kind::Failed; }));
    REQUIRE(tracker.find(*id)->delivery.cause == "Not connected");
    REQUIRE(tracker.messages().size() == 1);
    REQUIRE(tracker.pendingCount() == 0);

    wire.failing = false;
    REQUIRE(tracker.retry(*id));
    REQUIRE(waitUntil([&] { return kindOf(tracker, *id) == Kind::Sent; }));
    REQUIRE(wire.count() == 1);
    REQUIRE(wire.sent[0].id == *id);
    REQUIRE(tracker.messages().size() == 1);
}

TEST_CASE("retry only applies to failed messages", "[delivery]") {
    FakeWire wire;
    DeliveryTracker tracker("r1", me, wire.sender(), std::make_shared<ThreadPool>(1));
    auto id = tracker.submit("hello");
    REQUIRE(waitUntil([&] { return kindOf(tracker, *id) == Kind::Sent; }));

    REQUIRE_FALSE(tracker.retry(*id));
    REQUIRE_FALSE(tracker.retry("no-such-id"));
    REQUIRE(wire.count() == 1);
}

TEST_CASE("late write completion cannot undo a delivery", "[delivery]") {
    std::promise<void> gate;
    std::shared_future<void> open = gate.get_future().share();
    std::atomic<bool> entered{ false };
    auto pool = std::make_shared<ThreadPool>(1);
    DeliveryTracker tracker("r1", me, [&](const ChatMessageIntent&) {
        entered = true;
        open.wait();
    }, pool);

    auto id = tracker.submit("fast echo");
    REQUIRE(waitUntil([&] { return entered.load(); }));

    tracker.onEvent(MessageAck{ *id });
    REQUIRE(kindOf(tracker, *id) == Kind::Delivered);

    gate.set_value();
    pool->waitIdle();
    REQUIRE(kindOf(tracker, *id) == Kind::Delivered);
}

TEST_CASE("echo under a server id confirms the oldest pending copy", "[delivery]") {
    FakeWire wire;
    auto pool = std::make_shared<ThreadPool>(1);
    DeliveryTracker tracker("r1", me, wire.sender(), pool);

    auto a = tracker.submit("same");
    auto b = tracker.submit("same");
    pool->waitIdle();

    tracker.onEvent(MessageReceived{ incoming("srv-1", me.id, "same") });
    REQUIRE(kindOf(tracker, *a) == Kind::Delivered);
    REQUIRE(kindOf(tracker, *b) == Kind::Sent);
    REQUIRE(tracker.messages().size() == 2);

    tracker.onEvent(MessageReceived{ incoming("srv-2", me.id, "same") });
    REQUIRE(kindOf(tracker, *b) == Kind::Delivered);

    /* server ids resolve through the alias; a repeat ack changes nothing */
    tracker.onEvent(MessageAck{ "srv-1" });
    REQUIRE(tracker.messages().size() == 2);

    auto viaServerId = tracker.find("srv-2");
    REQUIRE(viaServerId);
    REQUIRE(viaServerId->id == *b);
}

TEST_CASE("own echo matching nothing is not appended", "[delivery]") {
    FakeWire wire;
    DeliveryTracker tracker("r1", me, wire.sender(), std::make_shared<ThreadPool>(1));
    tracker.onEvent(MessageReceived{ incoming("srv-9", me.id, "from another device") });
    REQUIRE(tracker.messages().empty());
}

TEST_CASE("messages from others are appended once", "[delivery]") {
    FakeWire wire;
    DeliveryTracker tracker("r1", me, wire.sender(), std::make_shared<ThreadPool>(1));

    std::atomic<int> changes{ 0 };
    auto sub = tracker.onChange([&](const Message&) { ++changes; });

    tracker.onEvent(MessageReceived{ incoming("m1", "u2", "hey") });
    tracker.onEvent(MessageReceived{ incoming("m1", "u2", "hey") });
    tracker.onEvent(MessageReceived{ incoming("m2", "u2", "elsewhere", "r2") });

    auto list = tracker.messages();
    REQUIRE(list.size() == 1);
    REQUIRE(list[0].id == "m1");
    REQUIRE(list[0].delivery.is(Kind::Delivered));
    REQUIRE(changes == 1);
}

TEST_CASE("ack for an unknown id is ignored", "[delivery]") {
    FakeWire wire;
    DeliveryTracker tracker("r1", me, wire.sender(), std::make_shared<ThreadPool>(1));
    tracker.onEvent(MessageAck{ "ghost" });
    tracker.onEvent(UserRegistered{});
    REQUIRE(tracker.messages().empty());
}

TEST_CASE("history is placed before live messages without duplicates", "[delivery][history]") {
    FakeWire wire;
    DeliveryTracker tracker("r1", me, wire.sender(), std::make_shared<ThreadPool>(1));
    tracker.onEvent(MessageReceived{ incoming("m3", "u2", "live") });

    std::vector<Message> history{
        incoming("m1", "u2", "old"),
        incoming("m2", me.id, "older reply"),
        incoming("m3", "u2", "live"),
        incoming("x", "u2", "other room", "r9"),
        incoming("m1", "u2", "old"),
    };
    REQUIRE(tracker.seedHistory(history) == 2);

    auto list = tracker.messages();
    REQUIRE(list.size() == 3);
    REQUIRE(list[0].id == "m1");
    REQUIRE(list[1].id == "m2");
    REQUIRE(list[2].id == "m3");
    REQUIRE(tracker.find("m3"));
    REQUIRE(tracker.seedHistory(history) == 0);
}

TEST_CASE("stopped pool fails the send instead of losing it", "[delivery]") {
    FakeWire wire;
    auto pool = std::make_shared<ThreadPool>(1);
    pool->join();
    DeliveryTracker tracker("r1", me, wire.sender(), pool);

    auto id = tracker.submit("hello");
    REQUIRE(kindOf(tracker, *id) == Kind::Failed);
}

TEST_CASE("sender throwing a non-chat exception still fails the message", "[delivery]") {
    auto pool = std::make_shared<ThreadPool>(1);
    DeliveryTracker tracker("r1", me,
        [](const ChatMessageIntent&) { throw std::runtime_error("socket exploded"); },
        pool);

    auto id = tracker.submit("hello");
    REQUIRE(id);
    REQUIRE(waitUntil([&] { return kindOf(tracker, *id) == Kind::Failed; }));
    REQUIRE(tracker.find(*id)->delivery.cause == "socket exploded");
    REQUIRE(tracker.pendingCount() == 0);
}
