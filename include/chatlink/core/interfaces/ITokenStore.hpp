/**
 * @file ITokenStore.hpp
 * @brief Key-value persistence for the bearer token.
 */
#pragma once
#include <optional>
#include <string>

namespace chatlink {

    /// Key under which the bearer token is persisted.
    inline constexpr const char* kAuthTokenKey = "auth_token";

    /**
     * @class ITokenStore
     * @brief Process-durable string key-value store.
     *
     * Implementations throw ChatError(Storage) on I/O failure.
     */
    class ITokenStore {
    public:
        virtual ~ITokenStore() = default;

        virtual std::optional<std::string> get(const std::string& key) const = 0;
        virtual void set(const std::string& key, const std::string& value) = 0;
        virtual void remove(const std::string& key) = 0;
    };

}
