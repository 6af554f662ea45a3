#include "chatlink/core/store/file_token_store.hpp"
#include "chatlink/core/util/error_types.hpp"
#include "chatlink/core/util/logger.hpp"
#include <msgpack.hpp>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace chatlink {

    FileTokenStore::FileTokenStore(std::string path)
        : path_(std::move(path))
    {
        load();
    }

    void FileTokenStore::load() {
        std::error_code ec;
        if (!fs::exists(path_, ec))
            return;

        std::ifstream in(path_, std::ios::binary);
        if (!in)
            throw ChatError(ChatErr::Storage, std::format("cannot open token store '{}'", path_));
        std::string bytes{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
        if (bytes.empty())
            return;

        try {
            msgpack::object_handle oh = msgpack::unpack(bytes.data(), bytes.size());
            msgpack::object obj = oh.get();
            if (obj.type != msgpack::type::MAP)
                throw ChatError(ChatErr::Storage, std::format("token store '{}' is not a map", path_));
            obj.convert(entries_);
        } catch (const msgpack::type_error& e) {
            throw ChatError(ChatErr::Storage, std::format("token store '{}' has invalid entries: {}", path_, e.what()));
        } catch (const msgpack::unpack_error& e) {
            throw ChatError(ChatErr::Storage, std::format("token store '{}' is corrupt: {}", path_, e.what()));
        }
    }

    void FileTokenStore::flush() const {
        msgpack::sbuffer buf;
        msgpack::pack(buf, entries_);

        const std::string tmp = path_ + ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out)
                throw ChatError(ChatErr::Storage, std::format("cannot write '{}'", tmp));
            out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
            out.flush();
            if (!out)
                throw ChatError(ChatErr::Storage, std::format("short write to '{}'", tmp));
        }

        std::error_code ec;
        fs::rename(tmp, path_, ec);
        if (ec) {
            fs::remove(tmp, ec);
            throw ChatError(ChatErr::Storage, std::format("cannot replace '{}': {}", path_, ec.message()));
        }
    }

    std::optional<std::string> FileTokenStore::get(const std::string& key) const {
        std::scoped_lock lk(mx_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    void FileTokenStore::set(const std::string& key, const std::string& value) {
        std::scoped_lock lk(mx_);
        auto previous = entries_;
        entries_[key] = value;
        try {
            flush();
        } catch (const ChatError&) {
            entries_ = std::move(previous);
            throw;
        }
        LOG_DEBUG(std::format("token store: '{}' saved", key));
    }

    void FileTokenStore::remove(const std::string& key) {
        std::scoped_lock lk(mx_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return;
        auto previous = entries_;
        entries_.erase(it);
        try {
            flush();
        } catch (const ChatError&) {
            entries_ = std::move(previous);
            throw;
        }
        LOG_DEBUG(std::format("token store: '{}' removed", key));
    }

}
