#include "chatlink/core/session/connection_manager.hpp"
#include "chatlink/core/session/heartbeat_driver.hpp"
#include "chatlink/core/session/reconnect_policy.hpp"
#include "chatlink/core/protocol/json_frame_codec.hpp"
#include "chatlink/core/util/error_types.hpp"
#include "chatlink/core/util/logger.hpp"
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

using namespace chatlink;

namespace {

    /* joining a thread from itself would deadlock; such a thread is left to finish on return */
    void joinOrDetach(std::jthread& t) {
        if (!t.joinable()) return;
        t.request_stop();
        if (t.get_id() == std::this_thread::get_id())
            t.detach();
        else
            t.join();
    }

    const char* kMaxAttemptsReason = "Max reconnect attempts reached";
    const char* kNoCredentialReason = "No credential available for reconnect";

}

/*──────────────── Impl ───────────────*/
struct ConnectionManager::Impl : std::enable_shared_from_this<ConnectionManager::Impl> {

    enum class Outcome { Ok, Rejected, Timeout, Lost, OpenFailed, Stopped };

    struct HandshakeResult {
        Outcome     outcome;
        std::string reason;
    };

    Impl(ClientOptions o, TransportFactory f, std::shared_ptr<IFrameCodec> c)
        : opts(std::move(o)),
          factory(std::move(f)),
          codec(c ? std::move(c) : std::make_shared<JsonFrameCodec>()),
          policy(opts.backoffStrategy(), opts.maxReconnectAttempts) {}

    ClientOptions                 opts;
    TransportFactory              factory;
    std::shared_ptr<IFrameCodec>  codec;
    ReconnectPolicy               policy;

    LatestValue<ConnectionState>  stateStream{ ConnectionState::disconnected() };
    EventHub<InboundEvent>        events;

    /* guarded by mx */
    mutable std::mutex            mx;
    std::condition_variable       authCv;
    std::condition_variable_any   reconnectCv;
    ConnectionState               state{ ConnectionState::disconnected() };
    uint64_t                      stateSeq{ 0 };
    uint32_t                      attempts{ 0 };
    bool                          authenticated{ false };
    bool                          stopping{ false };
    std::optional<std::string>    credential;
    std::shared_ptr<ITransport>   transport;
    uint64_t                      generation{ 0 };
    bool                          inHandshake{ false };
    std::optional<AuthResult>     authResult;
    bool                          transportLost{ false };
    std::jthread                  reader;
    std::jthread                  reconnector;
    std::unique_ptr<HeartbeatDriver> heartbeat;

    /* publication order */
    std::recursive_mutex          publishMx;
    uint64_t                      publishedSeq{ 0 };

    uint64_t setStateLocked(ConnectionState s) {
        state = std::move(s);
        return ++stateSeq;
    }

    /* a publication overtaken by a newer one is dropped, so observers end on the current state */
    void publish(uint64_t seq, const ConnectionState& s) {
        std::scoped_lock lk(publishMx);
        if (seq <= publishedSeq) return;
        publishedSeq = seq;
        LOG_INFO(std::format("connection state: {}", s.displayText()));
        stateStream.set(s);
    }

    HandshakeResult handshake(const std::string& token);
    void teardown(uint64_t gen, const std::shared_ptr<ITransport>& t);
    void readLoop(std::stop_token st, std::shared_ptr<ITransport> t, uint64_t gen);
    void dispatch(const std::shared_ptr<ITransport>& t, uint64_t gen, const std::string& frame);
    void onTransportFailure(uint64_t gen, const std::string& why);
    void reconnectLoop(std::stop_token st);
    void fail(const std::string& reason);
    void disconnect();
    std::unique_ptr<HeartbeatDriver> makeHeartbeat(const std::shared_ptr<ITransport>& t, uint64_t gen);
};

/*──────────────── Handshake ───────────────*/
ConnectionManager::Impl::HandshakeResult
ConnectionManager::Impl::handshake(const std::string& token)
{
    std::shared_ptr<ITransport> t;
    try {
        t = factory();
    } catch (const std::exception& ex) {
        return { Outcome::OpenFailed, ex.what() };
    }
    if (!t) return { Outcome::OpenFailed, "transport factory returned null" };

    uint64_t gen;
    std::jthread stale;
    {
        std::scoped_lock lk(mx);
        if (stopping) return { Outcome::Stopped, {} };
        gen = ++generation;
        transport = t;
        inHandshake = true;
        authResult.reset();
        transportLost = false;
        authenticated = false;
        stale = std::move(reader);
    }
    joinOrDetach(stale);

    try {
        t->open(opts.url);
    } catch (const std::exception& ex) {
        LOG_WARN(std::format("open {} failed: {}", opts.url, ex.what()));
        teardown(gen, t);
        return { Outcome::OpenFailed, ex.what() };
    }

    {
        std::unique_lock lk(mx);
        if (stopping || generation != gen) {
            lk.unlock();
            t->close();
            return { Outcome::Stopped, {} };
        }
        reader = std::jthread([self = shared_from_this(), t, gen](std::stop_token st) {
            self->readLoop(st, t, gen);
        });
    }

    try {
        t->write(codec->encode(AuthIntent{ token }));
    } catch (const std::exception& ex) {
        LOG_WARN(std::format("sending auth frame failed: {}", ex.what()));
        teardown(gen, t);
        return { Outcome::Lost, "Connection lost during authentication" };
    }

    HandshakeResult result;
    uint64_t seq = 0;
    {
        std::unique_lock lk(mx);
        authCv.wait_for(lk, opts.authTimeout, [&] {
            return stopping || generation != gen || authResult.has_value() || transportLost;
        });
        inHandshake = false;

        if (stopping || generation != gen) {
            result = { Outcome::Stopped, {} };
        } else if (authResult && authResult->accepted) {
            authenticated = true;
            attempts = 0;
            seq = setStateLocked(ConnectionState::connected());
            heartbeat = makeHeartbeat(t, gen);
            heartbeat->start();
            result = { Outcome::Ok, {} };
        } else if (authResult) {
            result = { Outcome::Rejected,
                       authResult->reason.empty() ? "Authentication rejected" : authResult->reason };
        } else if (transportLost) {
            result = { Outcome::Lost, "Connection lost during authentication" };
        } else {
            result = { Outcome::Timeout, "Authentication timed out" };
        }
    }

    if (result.outcome == Outcome::Ok) {
        publish(seq, ConnectionState::connected());
        events.emit(SessionConnected{});
        return result;
    }

    LOG_WARN(std::format("handshake failed: {}", result.reason));
    teardown(gen, t);
    return result;
}

void ConnectionManager::Impl::teardown(uint64_t gen, const std::shared_ptr<ITransport>& t)
{
    std::jthread rd;
    {
        std::scoped_lock lk(mx);
        if (generation == gen) {
            inHandshake = false;
            authenticated = false;
            if (transport == t) transport.reset();
            rd = std::move(reader);
        }
    }
    t->close();
    joinOrDetach(rd);
}

std::unique_ptr<HeartbeatDriver>
ConnectionManager::Impl::makeHeartbeat(const std::shared_ptr<ITransport>& t, uint64_t gen)
{
    std::weak_ptr<Impl> weak = weak_from_this();
    auto ping = codec->encode(PingIntent{});
    return std::make_unique<HeartbeatDriver>(
        opts.heartbeatInterval,
        [t, ping] { t->write(ping); },
        [weak, gen](const std::string& why) {
            if (auto self = weak.lock())
                self->onTransportFailure(gen, std::format("heartbeat: {}", why));
        });
}

/*──────────────── Receive loop ───────────────*/
void ConnectionManager::Impl::readLoop(std::stop_token st, std::shared_ptr<ITransport> t, uint64_t gen)
{
    while (!st.stop_requested()) {
        std::string frame;
        try {
            frame = t->read();
        } catch (const std::exception& ex) {
            if (!st.stop_requested())
                onTransportFailure(gen, ex.what());
            return;
        }
        dispatch(t, gen, frame);
    }
}

void ConnectionManager::Impl::dispatch(const std::shared_ptr<ITransport>& t, uint64_t gen, const std::string& frame)
{
    DecodedFrame decoded = codec->decode(frame);

    if (auto* ev = std::get_if<InboundEvent>(&decoded)) {
        LOG_TRACE(std::format("event {}", eventName(*ev)));
        events.emit(*ev);
    }
    else if (auto* auth = std::get_if<AuthResult>(&decoded)) {
        std::scoped_lock lk(mx);
        if (gen == generation && inHandshake && !authResult) {
            authResult = *auth;
            authCv.notify_all();
        } else {
            LOG_DEBUG("auth acknowledgment outside of a handshake ignored");
        }
    }
    else if (std::holds_alternative<PingFrame>(decoded)) {
        try {
            t->write("pong");
        } catch (const std::exception& ex) {
            LOG_WARN(std::format("pong failed: {}", ex.what()));
        }
    }
    else if (std::holds_alternative<ServerHello>(decoded)) {
        LOG_INFO("server hello received");
    }
    else if (auto* ign = std::get_if<Ignored>(&decoded)) {
        LOG_DEBUG(std::format("frame dropped ({}): {}", ign->why, frame.substr(0, 120)));
    }
}

/*──────────────── Failure & reconnect ───────────────*/
void ConnectionManager::Impl::onTransportFailure(uint64_t gen, const std::string& why)
{
    std::unique_lock lk(mx);
    if (gen != generation || stopping) return;

    if (inHandshake) {
        transportLost = true;
        authCv.notify_all();
        return;
    }
    if (!state.is(ConnectionState::Kind::Connected)) return;

    LOG_WARN(std::format("connection lost: {}", why));
    authenticated = false;
    auto t  = std::move(transport);
    auto hb = std::move(heartbeat);
    auto finished = std::move(reconnector);

    uint64_t seq;
    ConnectionState next;
    if (!credential) {
        next = ConnectionState::failed(kNoCredentialReason);
        seq = setStateLocked(next);
    } else if (policy.delayFor(attempts + 1)) {
        next = ConnectionState::reconnecting();
        seq = setStateLocked(next);
        reconnector = std::jthread([self = shared_from_this()](std::stop_token st) {
            self->reconnectLoop(st);
        });
    } else {
        next = ConnectionState::failed(kMaxAttemptsReason);
        seq = setStateLocked(next);
    }
    lk.unlock();

    if (t) t->close();
    if (hb) hb->stop();
    joinOrDetach(finished);
    publish(seq, next);
}

void ConnectionManager::Impl::reconnectLoop(std::stop_token st)
{
    while (!st.stop_requested()) {
        uint32_t attempt;
        std::string token;
        {
            std::scoped_lock lk(mx);
            if (stopping) return;
            attempt = ++attempts;
            token = credential.value_or(std::string{});
        }

        auto delay = policy.delayFor(attempt);
        if (!delay) {
            fail(kMaxAttemptsReason);
            return;
        }

        LOG_INFO(std::format("reconnect attempt {}/{} in {} ms",
                             attempt, policy.maxAttempts(), delay->count()));
        {
            std::unique_lock lk(mx);
            reconnectCv.wait_for(lk, st, *delay, [this] { return stopping; });
            if (stopping || st.stop_requested()) return;
        }

        auto res = handshake(token);
        switch (res.outcome) {
            case Outcome::Ok:
                LOG_INFO(std::format("reconnected after {} attempt(s)", attempt));
                return;
            case Outcome::Rejected:
                fail(res.reason);
                return;
            case Outcome::Stopped:
                return;
            case Outcome::Timeout:
            case Outcome::Lost:
            case Outcome::OpenFailed:
                LOG_WARN(std::format("reconnect attempt {} failed: {}", attempt, res.reason));
                break;
        }
    }
}

void ConnectionManager::Impl::fail(const std::string& reason)
{
    uint64_t seq;
    ConnectionState next = ConnectionState::failed(reason);
    {
        std::scoped_lock lk(mx);
        if (stopping) return;
        authenticated = false;
        seq = setStateLocked(next);
    }
    LOG_ERROR(std::format("connection failed: {}", reason));
    publish(seq, next);
}

/*──────────────── Disconnect ───────────────*/
void ConnectionManager::Impl::disconnect()
{
    std::shared_ptr<ITransport> t;
    std::unique_ptr<HeartbeatDriver> hb;
    std::jthread rd, rc;
    uint64_t seq = 0;
    bool changed;
    {
        std::scoped_lock lk(mx);
        changed = !state.is(ConnectionState::Kind::Disconnected);
        stopping = true;
        authenticated = false;
        credential.reset();
        ++generation;
        t  = std::move(transport);
        hb = std::move(heartbeat);
        rd = std::move(reader);
        rc = std::move(reconnector);
        if (changed)
            seq = setStateLocked(ConnectionState::disconnected());
        authCv.notify_all();
    }
    reconnectCv.notify_all();

    if (rc.joinable()) rc.request_stop();
    if (rd.joinable()) rd.request_stop();
    if (t) t->close();
    if (hb) hb->stop();
    joinOrDetach(rd);
    joinOrDetach(rc);

    if (changed) {
        publish(seq, ConnectionState::disconnected());
        events.emit(SessionDisconnected{});
    }
}

/*──────────────── Public API ───────────────*/
ConnectionManager::ConnectionManager(ClientOptions options,
                                     TransportFactory factory,
                                     std::shared_ptr<IFrameCodec> codec)
    : pImpl_(std::make_shared<Impl>(std::move(options), std::move(factory), std::move(codec)))
{}

ConnectionManager::~ConnectionManager()
{
    pImpl_->disconnect();
}

void ConnectionManager::connect(const std::string& credential)
{
    uint64_t seq;
    std::jthread finished;
    {
        std::scoped_lock lk(pImpl_->mx);
        auto k = pImpl_->state.kind;
        if (k == ConnectionState::Kind::Connecting ||
            k == ConnectionState::Kind::Connected ||
            k == ConnectionState::Kind::Reconnecting) {
            LOG_DEBUG(std::format("connect ignored while {}", pImpl_->state.displayText()));
            return;
        }
        pImpl_->stopping = false;
        if (credential.empty()) pImpl_->credential.reset();
        else pImpl_->credential = credential;
        pImpl_->attempts = 0;
        finished = std::move(pImpl_->reconnector);
        seq = pImpl_->setStateLocked(ConnectionState::connecting());
    }
    joinOrDetach(finished);
    pImpl_->publish(seq, ConnectionState::connecting());

    auto res = pImpl_->handshake(credential);
    switch (res.outcome) {
        case Impl::Outcome::Ok:
            return;
        case Impl::Outcome::Stopped:
            throw ChatError(ChatErr::Transport, "connect cancelled by disconnect");
        case Impl::Outcome::OpenFailed:
            pImpl_->fail(res.reason);
            throw ChatError(ChatErr::Transport, res.reason);
        case Impl::Outcome::Rejected:
        case Impl::Outcome::Timeout:
        case Impl::Outcome::Lost:
            pImpl_->fail(res.reason);
            throw ChatError(ChatErr::AuthenticationFailed, res.reason);
    }
}

void ConnectionManager::disconnect()
{
    pImpl_->disconnect();
}

void ConnectionManager::send(const OutboundIntent& intent)
{
    std::shared_ptr<ITransport> t;
    {
        std::scoped_lock lk(pImpl_->mx);
        if (!pImpl_->authenticated || !pImpl_->transport)
            throw ChatError(ChatErr::NotConnected, "Not connected");
        t = pImpl_->transport;
    }
    t->write(pImpl_->codec->encode(intent));
}

void ConnectionManager::sendText(std::string_view text)
{
    std::shared_ptr<ITransport> t;
    {
        std::scoped_lock lk(pImpl_->mx);
        if (!pImpl_->authenticated || !pImpl_->transport)
            throw ChatError(ChatErr::NotConnected, "Not connected");
        t = pImpl_->transport;
    }
    t->write(text);
}

ConnectionState ConnectionManager::state() const
{
    std::scoped_lock lk(pImpl_->mx);
    return pImpl_->state;
}

Subscription ConnectionManager::subscribeState(StateCallback cb)
{
    return pImpl_->stateStream.subscribe(std::move(cb));
}

Subscription ConnectionManager::subscribe(EventCallback cb)
{
    return pImpl_->events.subscribe(std::move(cb));
}

uint32_t ConnectionManager::reconnectAttempts() const
{
    std::scoped_lock lk(pImpl_->mx);
    return pImpl_->attempts;
}

bool ConnectionManager::isAuthenticated() const
{
    std::scoped_lock lk(pImpl_->mx);
    return pImpl_->authenticated;
}

