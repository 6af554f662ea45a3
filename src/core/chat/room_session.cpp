#include "chatlink/core/chat/room_session.hpp"
#include "chatlink/core/chat/delivery_tracker.hpp"
#include "chatlink/core/chat/typing_debouncer.hpp"
#include "chatlink/core/interfaces/IHistorySource.hpp"
#include "chatlink/core/session/connection_manager.hpp"
#include "chatlink/core/util/error_types.hpp"
#include "chatlink/core/util/logger.hpp"
#include "chatlink/core/util/thread_pool.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <format>
#include <functional>
#include <mutex>

namespace chatlink {

    namespace {
        std::vector<std::string> sorted(const ankerl::unordered_dense::set<std::string>& s) {
            std::vector<std::string> out(s.begin(), s.end());
            std::sort(out.begin(), out.end());
            return out;
        }
    }

    struct RoomSession::Impl {
        Impl(ConnectionManager& c, std::shared_ptr<ThreadPool> p, std::string room, LocalUser user,
             std::chrono::milliseconds quiet)
            : conn(c),
              pool(std::move(p)),
              roomId(std::move(room)),
              me(std::move(user)),
              tracker(roomId, me,
                      [cm = &c](const ChatMessageIntent& intent) { cm->send(intent); },
                      pool),
              debouncer(quiet, [this](bool on) { sendTyping(on); }) {}

        void sendTyping(bool on) {
            try {
                pool->add(std::function<void()>([cm = &conn, room = roomId, on] {
                    try {
                        cm->send(TypingIntent{ room, on });
                    } catch (const ChatError& e) {
                        LOG_DEBUG(std::format("typing({}) not sent: {}", on, e.what()));
                    }
                }));
            } catch (const ChatError& e) {
                LOG_DEBUG(std::format("typing({}) dropped: {}", on, e.what()));
            }
        }

        void onEvent(const InboundEvent& ev) {
            if (auto* t = std::get_if<UserTyping>(&ev)) {
                if (t->roomId != roomId || t->userId == me.id) return;
                std::scoped_lock lk(mx);
                if (t->isTyping) typing.insert(t->userId);
                else typing.erase(t->userId);
                return;
            }
            if (auto* p = std::get_if<PresenceChanged>(&ev)) {
                std::scoped_lock lk(mx);
                if (p->isOnline) online.insert(p->userId);
                else {
                    online.erase(p->userId);
                    typing.erase(p->userId);
                }
                return;
            }
            if (auto* e = std::get_if<ServerError>(&ev)) {
                LOG_WARN(std::format("room {}: server error: {}", roomId, e->text));
                return;
            }
            tracker.onEvent(ev);
        }

        ConnectionManager&            conn;
        std::shared_ptr<ThreadPool>   pool;
        std::string                   roomId;
        LocalUser                     me;
        DeliveryTracker               tracker;
        TypingDebouncer               debouncer;
        Subscription                  events;

        mutable std::mutex            mx;
        std::string                   draft;
        ankerl::unordered_dense::set<std::string> typing;
        ankerl::unordered_dense::set<std::string> online;
    };

    RoomSession::RoomSession(std::unique_ptr<Impl> impl) : pImpl_(std::move(impl)) {}

    std::shared_ptr<RoomSession> RoomSession::open(ConnectionManager& conn,
                                                   std::shared_ptr<ThreadPool> pool,
                                                   std::string roomId,
                                                   LocalUser me,
                                                   std::chrono::milliseconds typingQuiet)
    {
        if (!pool)
            throw ChatError(ChatErr::Internal, "RoomSession requires a worker pool");

        auto impl = std::make_unique<Impl>(conn, std::move(pool), std::move(roomId), std::move(me), typingQuiet);
        std::shared_ptr<RoomSession> room(new RoomSession(std::move(impl)));

        std::weak_ptr<RoomSession> weak = room;
        room->pImpl_->events = conn.subscribe([weak](const InboundEvent& ev) {
            if (auto self = weak.lock())
                self->pImpl_->onEvent(ev);
        });
        LOG_DEBUG(std::format("room {} opened", room->roomId()));
        return room;
    }

    RoomSession::~RoomSession() {
        pImpl_->events.reset();
    }

    const std::string& RoomSession::roomId() const {
        return pImpl_->roomId;
    }

    void RoomSession::setDraft(std::string text) {
        {
            std::scoped_lock lk(pImpl_->mx);
            pImpl_->draft = text;
        }
        pImpl_->debouncer.textChanged(text);
    }

    std::string RoomSession::draft() const {
        std::scoped_lock lk(pImpl_->mx);
        return pImpl_->draft;
    }

    std::optional<std::string> RoomSession::sendDraft() {
        std::string text;
        {
            std::scoped_lock lk(pImpl_->mx);
            text = pImpl_->draft;
        }
        auto id = pImpl_->tracker.submit(text);
        if (!id) return std::nullopt;
        {
            std::scoped_lock lk(pImpl_->mx);
            if (pImpl_->draft == text) pImpl_->draft.clear();
        }
        pImpl_->debouncer.clear();
        return id;
    }

    std::optional<std::string> RoomSession::send(const std::string& content) {
        return pImpl_->tracker.submit(content);
    }

    bool RoomSession::retry(const std::string& messageId) {
        return pImpl_->tracker.retry(messageId);
    }

    std::vector<Message> RoomSession::messages() const {
        return pImpl_->tracker.messages();
    }

    std::optional<Message> RoomSession::find(const std::string& messageId) const {
        return pImpl_->tracker.find(messageId);
    }

    size_t RoomSession::pendingCount() const {
        return pImpl_->tracker.pendingCount();
    }

    std::vector<std::string> RoomSession::typingUsers() const {
        std::scoped_lock lk(pImpl_->mx);
        return sorted(pImpl_->typing);
    }

    std::vector<std::string> RoomSession::onlineUsers() const {
        std::scoped_lock lk(pImpl_->mx);
        return sorted(pImpl_->online);
    }

    size_t RoomSession::seedHistory(IHistorySource& source) {
        return pImpl_->tracker.seedHistory(source.fetchMessages(pImpl_->roomId));
    }

    Subscription RoomSession::onMessageChange(std::function<void(const Message&)> cb) {
        return pImpl_->tracker.onChange(std::move(cb));
    }

}
