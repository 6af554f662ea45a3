#include <catch2/catch_all.hpp>
#include "chatlink/core/auth/bearer_token.hpp"
#include "chatlink/core/store/file_token_store.hpp"
#include "chatlink/core/store/memory_token_store.hpp"
#include "chatlink/core/util/error_types.hpp"
#include "internal/core/util/random.hpp"

#include <jwt-cpp/jwt.h>

#include <filesystem>
#include <fstream>

using namespace chatlink;
namespace fs = std::filesystem;

namespace {
    /* unique scratch file removed on scope exit */
    struct TempPath {
        fs::path path = fs::temp_directory_path() / ("chatlink_test_" + uuidV4() + ".msgpack");
        ~TempPath() {
            std::error_code ec;
            fs::remove(path, ec);
            fs::remove(path.string() + ".tmp", ec);
        }
    };
}

TEST_CASE("MemoryTokenStore set, get and remove", "[store]") {
    MemoryTokenStore store;
    REQUIRE_FALSE(store.get(kAuthTokenKey));
    store.set(kAuthTokenKey, "abc");
    REQUIRE(store.get(kAuthTokenKey) == "abc");
    store.set(kAuthTokenKey, "def");
    REQUIRE(store.get(kAuthTokenKey) == "def");
    store.remove(kAuthTokenKey);
    store.remove(kAuthTokenKey);
    REQUIRE_FALSE(store.get(kAuthTokenKey));
}

TEST_CASE("FileTokenStore persists across instances", "[store]") {
    TempPath tmp;
    {
        FileTokenStore store(tmp.path.string());
        REQUIRE_FALSE(store.get(kAuthTokenKey));
        store.set(kAuthTokenKey, "token-1");
        store.set("other", "x");
    }
    {
        FileTokenStore store(tmp.path.string());
        REQUIRE(store.get(kAuthTokenKey) == "token-1");
        REQUIRE(store.get("other") == "x");
        store.remove(kAuthTokenKey);
    }
    FileTokenStore store(tmp.path.string());
    REQUIRE_FALSE(store.get(kAuthTokenKey));
    REQUIRE(store.get("other") == "x");
    REQUIRE_FALSE(fs::exists(tmp.path.string() + ".tmp"));
}

TEST_CASE("FileTokenStore rejects a corrupt file", "[store]") {
    TempPath tmp;
    {
        std::ofstream out(tmp.path, std::ios::binary);
        out << "\xc1\xc1\xc1 definitely not msgpack";
    }
    try {
        FileTokenStore store(tmp.path.string());
        FAIL("expected a storage error");
    } catch (const ChatError& e) {
        REQUIRE(e.code() == ChatErr::Storage);
    }
}

TEST_CASE("FileTokenStore reports an unwritable location", "[store]") {
    auto dir = fs::temp_directory_path() / ("chatlink_missing_" + uuidV4());
    FileTokenStore store((dir / "tokens.msgpack").string());
    try {
        store.set(kAuthTokenKey, "abc");
        FAIL("expected a storage error");
    } catch (const ChatError& e) {
        REQUIRE(e.code() == ChatErr::Storage);
    }
    REQUIRE_FALSE(store.get(kAuthTokenKey));
}

TEST_CASE("inspectBearer reads subject, name and expiry", "[auth]") {
    auto exp = std::chrono::system_clock::now() + std::chrono::hours(1);
    auto token = jwt::create()
        .set_subject("u42")
        .set_payload_claim("name", jwt::claim(std::string("Ann")))
        .set_expires_at(exp)
        .sign(jwt::algorithm::hs256{ "secret" });

    auto claims = inspectBearer(token);
    REQUIRE(claims);
    REQUIRE(claims->subject == "u42");
    REQUIRE(claims->name == "Ann");
    REQUIRE(claims->expiresAt);
    REQUIRE_FALSE(claims->expired(std::chrono::system_clock::now()));
    REQUIRE(claims->expired(exp + std::chrono::seconds(1)));
    REQUIRE(claims->user().id == "u42");
}

TEST_CASE("inspectBearer declines opaque or subject-less tokens", "[auth]") {
    REQUIRE_FALSE(inspectBearer("opaque-session-token"));
    REQUIRE_FALSE(inspectBearer(""));

    auto noSubject = jwt::create()
        .set_issuer("chat")
        .sign(jwt::algorithm::hs256{ "secret" });
    REQUIRE_FALSE(inspectBearer(noSubject));
}
