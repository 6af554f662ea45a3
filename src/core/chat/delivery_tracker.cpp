#include "chatlink/core/chat/delivery_tracker.hpp"
#include "chatlink/core/util/error_types.hpp"
#include "chatlink/core/util/logger.hpp"
#include "chatlink/core/util/thread_pool.hpp"
#include "internal/core/util/random.hpp"

#include <folly/SharedMutex.h>
#include <folly/container/F14Map.h>
#include <folly/container/F14Set.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace chatlink {

    namespace {

        bool isBlank(const std::string& s) {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        }

        /* forward-only, except Failed -> Sending which is the explicit retry */
        bool allowed(DeliveryState::Kind from, DeliveryState::Kind to) {
            using K = DeliveryState::Kind;
            switch (to) {
                case K::Sending:   return from == K::Failed;
                case K::Sent:      return from == K::Sending;
                case K::Delivered: return from != K::Delivered;
                case K::Failed:    return from == K::Sending || from == K::Sent;
            }
            return false;
        }
    }

    /* shared with queued send tasks so they can outlive the tracker */
    struct DeliveryTracker::State {
        Sender                                    sender;
        std::shared_ptr<ThreadPool>               pool;
        mutable folly::SharedMutex                mx;
        std::vector<Message>                      list;
        folly::F14FastMap<std::string, size_t>    byId;
        folly::F14FastMap<std::string, std::string> aliases;   ///< server id -> local id
        folly::F14FastSet<std::string>            pending;
        EventHub<Message>                         changes;

        /* resolves server-id aliases; requires mx held */
        const Message* lookup(const std::string& id) const {
            auto it = byId.find(id);
            if (it == byId.end()) {
                auto al = aliases.find(id);
                if (al == aliases.end()) return nullptr;
                it = byId.find(al->second);
                if (it == byId.end()) return nullptr;
            }
            return &list[it->second];
        }

        Message* lookup(const std::string& id) {
            return const_cast<Message*>(std::as_const(*this).lookup(id));
        }

        /* requires mx held exclusively; returns the updated copy when the move was legal */
        std::optional<Message> transition(Message& m, DeliveryState next) {
            if (!allowed(m.delivery.kind, next.kind)) {
                LOG_TRACE(std::format("message {}: {} -> {} ignored",
                    m.id, toString(m.delivery.kind), toString(next.kind)));
                return std::nullopt;
            }
            m.delivery = std::move(next);
            if (m.delivery.pending()) pending.insert(m.id);
            else pending.erase(m.id);
            return m;
        }

        void update(const std::string& id, DeliveryState next) {
            std::optional<Message> changed;
            {
                std::unique_lock lk(mx);
                if (Message* m = lookup(id))
                    changed = transition(*m, std::move(next));
            }
            if (changed) changes.emit(*changed);
        }

        static void dispatch(const std::shared_ptr<State>& self, ChatMessageIntent intent) {
            std::weak_ptr<State> weak = self;
            std::function<void()> task = [weak, intent] {
                auto st = weak.lock();
                if (!st) return;
                try {
                    st->sender(intent);
                    st->update(intent.id, DeliveryState::sent());
                } catch (const ChatError& e) {
                    LOG_WARN(std::format("message {} failed: {} ({})", intent.id, e.what(), errName(e.code())));
                    st->update(intent.id, DeliveryState::failed(e.what()));
                } catch (const std::exception& e) {
                    LOG_WARN(std::format("message {} failed: {}", intent.id, e.what()));
                    st->update(intent.id, DeliveryState::failed(e.what()));
                }
            };
            try {
                self->pool->add(std::move(task));
            } catch (const ChatError& e) {
                self->update(intent.id, DeliveryState::failed(e.what()));
            }
        }
    };

    DeliveryTracker::DeliveryTracker(std::string roomId, LocalUser user, Sender sender, std::shared_ptr<ThreadPool> pool)
        : roomId_(std::move(roomId)), user_(std::move(user)), st_(std::make_shared<State>())
    {
        st_->sender = std::move(sender);
        st_->pool = std::move(pool);
    }

    DeliveryTracker::~DeliveryTracker() = default;

    std::optional<std::string> DeliveryTracker::submit(const std::string& content) {
        if (isBlank(content)) return std::nullopt;

        Message m;
        m.id         = uuidV4();
        m.senderId   = user_.id;
        m.senderName = user_.name;
        m.content    = content;
        m.timestamp  = std::chrono::system_clock::now();
        m.roomId     = roomId_;
        m.delivery   = DeliveryState::sending();
        {
            std::unique_lock lk(st_->mx);
            st_->byId.emplace(m.id, st_->list.size());
            st_->list.push_back(m);
            st_->pending.insert(m.id);
        }
        st_->changes.emit(m);
        State::dispatch(st_, ChatMessageIntent{ m.id, m.content, m.roomId });
        return m.id;
    }

    bool DeliveryTracker::retry(const std::string& id) {
        std::optional<Message> changed;
        {
            std::unique_lock lk(st_->mx);
            Message* m = st_->lookup(id);
            if (!m || !m->delivery.is(DeliveryState::Kind::Failed)) return false;
            changed = st_->transition(*m, DeliveryState::sending());
        }
        if (!changed) return false;
        st_->changes.emit(*changed);
        State::dispatch(st_, ChatMessageIntent{ changed->id, changed->content, changed->roomId });
        return true;
    }

    void DeliveryTracker::onEvent(const InboundEvent& ev) {
        if (auto* ack = std::get_if<MessageAck>(&ev)) {
            st_->update(ack->messageId, DeliveryState::delivered());
            return;
        }
        auto* rcv = std::get_if<MessageReceived>(&ev);
        if (!rcv) return;

        const Message& in = rcv->message;
        if (in.roomId != roomId_) return;

        std::optional<Message> changed;
        {
            std::unique_lock lk(st_->mx);
            if (in.senderId == user_.id) {
                Message* target = st_->lookup(in.id);
                if (!target) {
                    /* server assigned its own id: confirm the oldest in-flight copy of this text */
                    for (auto& m : st_->list) {
                        if (m.delivery.pending() && m.senderId == user_.id && m.content == in.content) {
                            target = &m;
                            st_->aliases.emplace(in.id, m.id);
                            break;
                        }
                    }
                }
                if (!target) {
                    LOG_DEBUG(std::format("echo {} matches no local message", in.id));
                    return;
                }
                changed = st_->transition(*target, DeliveryState::delivered());
            } else {
                if (st_->byId.count(in.id) > 0) return;
                Message m = in;
                m.delivery = DeliveryState::delivered();
                st_->byId.emplace(m.id, st_->list.size());
                st_->list.push_back(m);
                changed = std::move(m);
            }
        }
        if (changed) st_->changes.emit(*changed);
    }

    size_t DeliveryTracker::seedHistory(const std::vector<Message>& history) {
        size_t inserted = 0;
        {
            std::unique_lock lk(st_->mx);
            std::vector<Message> merged;
            merged.reserve(history.size() + st_->list.size());
            folly::F14FastSet<std::string> seen;
            for (const auto& h : history) {
                if (h.roomId != roomId_) continue;
                if (st_->byId.count(h.id) > 0 || st_->aliases.count(h.id) > 0 || !seen.insert(h.id).second)
                    continue;
                Message m = h;
                m.delivery = DeliveryState::delivered();
                merged.push_back(std::move(m));
                ++inserted;
            }
            if (inserted == 0) return 0;

            for (auto& m : st_->list)
                merged.push_back(std::move(m));
            st_->list = std::move(merged);
            st_->byId.clear();
            for (size_t i = 0; i < st_->list.size(); ++i)
                st_->byId.emplace(st_->list[i].id, i);
        }
        LOG_DEBUG(std::format("room {}: {} history message(s) seeded", roomId_, inserted));
        return inserted;
    }

    std::vector<Message> DeliveryTracker::messages() const {
        std::shared_lock lk(st_->mx);
        return st_->list;
    }

    std::optional<Message> DeliveryTracker::find(const std::string& id) const {
        std::shared_lock lk(st_->mx);
        if (const Message* m = st_->lookup(id)) return *m;
        return std::nullopt;
    }

    size_t DeliveryTracker::pendingCount() const {
        std::shared_lock lk(st_->mx);
        return st_->pending.size();
    }

    Subscription DeliveryTracker::onChange(ChangeCallback cb) {
        return st_->changes.subscribe(std::move(cb));
    }

}
