/**
 * @file file_token_store.hpp
 * @brief File-backed ITokenStore.
 */
#pragma once
#include <map>
#include <mutex>
#include <string>

#include "chatlink/core/interfaces/ITokenStore.hpp"

namespace chatlink {

    /**
     * @class FileTokenStore
     * @brief Persists a string map as a MessagePack map in a single file.
     *
     * Every mutation rewrites the file through a temporary sibling and an
     * atomic rename, so a crash leaves either the old or the new content.
     * A missing file reads as an empty store.
     */
    class FileTokenStore : public ITokenStore {
    public:
        /**
         * @throws ChatError(Storage) if an existing file cannot be read or decoded
         */
        explicit FileTokenStore(std::string path);

        std::optional<std::string> get(const std::string& key) const override;
        void set(const std::string& key, const std::string& value) override;
        void remove(const std::string& key) override;

        const std::string& path() const { return path_; }

    private:
        void load();
        void flush() const;

        std::string path_;
        mutable std::mutex mx_;
        std::map<std::string, std::string> entries_;
    };

}
