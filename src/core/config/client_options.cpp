#include "chatlink/core/config/client_options.hpp"
#include "chatlink/core/strategies/exponential_backoff.hpp"
#include "chatlink/core/util/error_types.hpp"
#include <nlohmann/json.hpp>
#include <format>
#include <fstream>
#include <sstream>

namespace chatlink {

    using nlohmann::json;

    namespace {
        void readMillis(const json& j, const char* key, std::chrono::milliseconds& out) {
            if (auto it = j.find(key); it != j.end()) {
                if (!it->is_number_integer() || it->get<long long>() < 0)
                    throw ChatError(ChatErr::Configuration, std::format("'{}' must be a non-negative integer", key));
                out = std::chrono::milliseconds(it->get<long long>());
            }
        }
    }

    std::shared_ptr<IBackoffStrategy> ClientOptions::backoffStrategy() const {
        if (backoff) return backoff;
        return std::make_shared<ExponentialBackoff>(reconnectBaseDelay, reconnectMaxDelay);
    }

    ClientOptions ClientOptions::fromJson(std::string_view text) {
        json j = json::parse(text.begin(), text.end(), nullptr, false);
        if (j.is_discarded() || !j.is_object())
            throw ChatError(ChatErr::Configuration, "options document is not a JSON object");

        ClientOptions o;
        try {
            if (j.contains("url"))            o.url = j.at("url").get<std::string>();
            if (j.contains("tokenStorePath")) o.tokenStorePath = j.at("tokenStorePath").get<std::string>();
            if (j.contains("maxReconnectAttempts"))
                o.maxReconnectAttempts = j.at("maxReconnectAttempts").get<uint32_t>();
            if (j.contains("sendWorkers"))
                o.sendWorkers = j.at("sendWorkers").get<size_t>();
            if (j.contains("logLevel")) {
                auto name = j.at("logLevel").get<std::string>();
                o.logLevel = Logger::parseLevel(name, LogLevel::Info);
            }
        } catch (const json::exception& ex) {
            throw ChatError(ChatErr::Configuration, std::format("invalid options: {}", ex.what()));
        }

        readMillis(j, "authTimeoutMs", o.authTimeout);
        readMillis(j, "heartbeatIntervalMs", o.heartbeatInterval);
        readMillis(j, "reconnectBaseDelayMs", o.reconnectBaseDelay);
        readMillis(j, "reconnectMaxDelayMs", o.reconnectMaxDelay);
        readMillis(j, "typingQuietPeriodMs", o.typingQuietPeriod);

        if (o.url.rfind("ws://", 0) != 0)
            throw ChatError(ChatErr::Configuration, std::format("unsupported url '{}': only ws:// is supported", o.url));
        if (o.sendWorkers == 0)
            throw ChatError(ChatErr::Configuration, "'sendWorkers' must be at least 1");
        return o;
    }

    ClientOptions ClientOptions::fromFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw ChatError(ChatErr::Configuration, std::format("cannot open options file '{}'", path));
        std::ostringstream ss;
        ss << in.rdbuf();
        return fromJson(ss.str());
    }

}
