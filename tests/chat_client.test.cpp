#include <catch2/catch_all.hpp>
#include "chatlink/core/chat/room_session.hpp"
#include "chatlink/core/client.hpp"
#include "chatlink/core/session/connection_manager.hpp"
#include "chatlink/core/store/memory_token_store.hpp"
#include "mock_transport.hpp"

#include <jwt-cpp/jwt.h>

using namespace chatlink;
using namespace std::chrono_literals;
using Kind = ConnectionState::Kind;

namespace {
    const LocalUser me{ "u1", "Ann" };

    std::string signedToken(std::chrono::system_clock::time_point exp) {
        return jwt::create()
            .set_subject("u7")
            .set_payload_claim("name", jwt::claim(std::string("Zed")))
            .set_expires_at(exp)
            .sign(jwt::algorithm::hs256{ "k" });
    }
}

TEST_CASE("login stores the token and connects", "[client]") {
    MockServer server;
    auto store = std::make_shared<MemoryTokenStore>();
    ChatClient client(fastOptions(), store, server.factory());

    client.login("tok-1", me);

    REQUIRE(client.connection().state().is(Kind::Connected));
    REQUIRE(store->get(kAuthTokenKey) == "tok-1");
    REQUIRE(client.currentUser());
    REQUIRE(client.currentUser()->id == "u1");
    REQUIRE(server.last()->lastToken() == "tok-1");
}

TEST_CASE("second login replaces the live session", "[client]") {
    MockServer server;
    auto store = std::make_shared<MemoryTokenStore>();
    ChatClient client(fastOptions(), store, server.factory());

    client.login("tok-A", me);
    auto first = server.last();

    const LocalUser other{ "u2", "Bob" };
    client.login("tok-B", other);

    REQUIRE(server.count() == 2);
    REQUIRE(first->closed());
    REQUIRE(server.last()->lastToken() == "tok-B");
    REQUIRE(client.connection().state().is(Kind::Connected));
    REQUIRE(client.currentUser()->id == "u2");
    REQUIRE(store->get(kAuthTokenKey) == "tok-B");
}

TEST_CASE("resume on a live session keeps its identity", "[client]") {
    MockServer server;
    auto store = std::make_shared<MemoryTokenStore>();
    ChatClient client(fastOptions(), store, server.factory());

    client.login("tok-A", me);
    REQUIRE(client.resume(LocalUser{ "u2", "Bob" }));

    REQUIRE(server.count() == 1);
    REQUIRE(client.currentUser()->id == "u1");
}

TEST_CASE("rejected login clears the stored token", "[client]") {
    MockServer server;
    server.setConfigure([](MockTransport& t) { t.authReply = MockTransport::AuthReply::Reject; });
    auto store = std::make_shared<MemoryTokenStore>();
    ChatClient client(fastOptions(), store, server.factory());

    REQUIRE(errorCodeOf([&] { client.login("bad", me); }) == ChatErr::AuthenticationFailed);
    REQUIRE_FALSE(store->get(kAuthTokenKey));
}

TEST_CASE("resume without a stored token does nothing", "[client]") {
    MockServer server;
    ChatClient client(fastOptions(), std::make_shared<MemoryTokenStore>(), server.factory());
    REQUIRE_FALSE(client.resume(me));
    REQUIRE(server.count() == 0);
    REQUIRE(client.connection().state().is(Kind::Disconnected));
}

TEST_CASE("resume reconnects with the stored token", "[client]") {
    MockServer server;
    auto store = std::make_shared<MemoryTokenStore>();
    store->set(kAuthTokenKey, "saved");
    ChatClient client(fastOptions(), store, server.factory());

    REQUIRE(client.resume(me));
    REQUIRE(server.last()->lastToken() == "saved");
    REQUIRE(client.currentUser()->name == "Ann");
}

TEST_CASE("resume takes the identity from a JWT", "[client][auth]") {
    MockServer server;
    auto store = std::make_shared<MemoryTokenStore>();
    store->set(kAuthTokenKey, signedToken(std::chrono::system_clock::now() + 1h));
    ChatClient client(fastOptions(), store, server.factory());

    REQUIRE(client.resume());
    REQUIRE(client.currentUser()->id == "u7");
    REQUIRE(client.currentUser()->name == "Zed");
}

TEST_CASE("resume needs an identity for opaque tokens", "[client]") {
    MockServer server;
    auto store = std::make_shared<MemoryTokenStore>();
    store->set(kAuthTokenKey, "opaque");
    ChatClient client(fastOptions(), store, server.factory());

    REQUIRE_FALSE(client.resume());
    REQUIRE(server.count() == 0);
    REQUIRE(store->get(kAuthTokenKey) == "opaque");
}

TEST_CASE("expired token is cleared without dialing", "[client][auth]") {
    MockServer server;
    auto store = std::make_shared<MemoryTokenStore>();
    store->set(kAuthTokenKey, signedToken(std::chrono::system_clock::now() - 1h));
    ChatClient client(fastOptions(), store, server.factory());

    REQUIRE_FALSE(client.resume());
    REQUIRE(server.count() == 0);
    REQUIRE_FALSE(store->get(kAuthTokenKey));
}

TEST_CASE("rejected resume forgets token and user", "[client]") {
    MockServer server;
    server.setConfigure([](MockTransport& t) { t.authReply = MockTransport::AuthReply::Reject; });
    auto store = std::make_shared<MemoryTokenStore>();
    store->set(kAuthTokenKey, "stale");
    ChatClient client(fastOptions(), store, server.factory());

    REQUIRE_FALSE(client.resume(me));
    REQUIRE_FALSE(store->get(kAuthTokenKey));
    REQUIRE_FALSE(client.currentUser());
}

TEST_CASE("unreachable server keeps the token for later", "[client]") {
    MockServer server;
    server.setConfigure([](MockTransport& t) { t.openFails = true; });
    auto store = std::make_shared<MemoryTokenStore>();
    store->set(kAuthTokenKey, "good");
    ChatClient client(fastOptions(), store, server.factory());

    REQUIRE_FALSE(client.resume(me));
    REQUIRE(store->get(kAuthTokenKey) == "good");
    REQUIRE(client.connection().state().is(Kind::Failed));
}

TEST_CASE("logout disconnects and clears credentials", "[client]") {
    MockServer server;
    auto store = std::make_shared<MemoryTokenStore>();
    ChatClient client(fastOptions(), store, server.factory());
    client.login("tok", me);

    client.logout();

    REQUIRE(client.connection().state().is(Kind::Disconnected));
    REQUIRE_FALSE(store->get(kAuthTokenKey));
    REQUIRE_FALSE(client.currentUser());
    REQUIRE(server.last()->closed());
}

TEST_CASE("openRoom requires a logged-in user", "[client]") {
    MockServer server;
    ChatClient client(fastOptions(), std::make_shared<MemoryTokenStore>(), server.factory());
    REQUIRE(errorCodeOf([&] { (void)client.openRoom("r1"); }) == ChatErr::NotConnected);

    client.login("tok", me);
    auto room = client.openRoom("r1");
    REQUIRE(room->roomId() == "r1");

    auto id = room->send("hi");
    REQUIRE(waitUntil([&] { return room->find(*id)->delivery.is(DeliveryState::Kind::Sent); }));
}

TEST_CASE("client requires a token store", "[client]") {
    MockServer server;
    REQUIRE(errorCodeOf([&] { ChatClient c(fastOptions(), nullptr, server.factory()); }) == ChatErr::Internal);
}
