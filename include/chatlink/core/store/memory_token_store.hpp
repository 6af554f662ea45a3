/**
 * @file memory_token_store.hpp
 * @brief In-memory ITokenStore for tests and ephemeral sessions.
 */
#pragma once
#include <mutex>
#include <string>

#include <ankerl/unordered_dense.h>

#include "chatlink/core/interfaces/ITokenStore.hpp"

namespace chatlink {

    class MemoryTokenStore : public ITokenStore {
    public:
        std::optional<std::string> get(const std::string& key) const override {
            std::scoped_lock lk(mx_);
            auto it = map_.find(key);
            if (it == map_.end()) return std::nullopt;
            return it->second;
        }

        void set(const std::string& key, const std::string& value) override {
            std::scoped_lock lk(mx_);
            map_[key] = value;
        }

        void remove(const std::string& key) override {
            std::scoped_lock lk(mx_);
            map_.erase(key);
        }

    private:
        mutable std::mutex mx_;
        ankerl::unordered_dense::map<std::string, std::string> map_;
    };

}
