#include "chatlink/core/auth/bearer_token.hpp"
#include "chatlink/core/util/logger.hpp"
#include <jwt-cpp/jwt.h>
#include <format>

namespace chatlink {

    std::optional<BearerClaims> inspectBearer(const std::string& token) {
        try {
            auto decoded = jwt::decode(token);
            if (!decoded.has_subject())
                return std::nullopt;

            BearerClaims c;
            c.subject = decoded.get_subject();
            if (decoded.has_payload_claim("name"))
                c.name = decoded.get_payload_claim("name").as_string();
            if (decoded.has_expires_at())
                c.expiresAt = decoded.get_expires_at();
            return c;
        } catch (const std::exception& ex) {
            /* opaque (non-JWT) tokens are legal bearers; callers fall back to what they know */
            LOG_DEBUG(std::format("bearer is not an inspectable JWT: {}", ex.what()));
            return std::nullopt;
        }
    }

}
