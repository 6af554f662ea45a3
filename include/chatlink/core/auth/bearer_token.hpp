/**
 * @file bearer_token.hpp
 * @brief Inspection of JWT bearer tokens issued by the chat server.
 *
 * The client never verifies signatures (it does not hold the key); it only
 * reads the claims to learn who it is and whether the token is already
 * expired before attempting a silent resume.
 */
#pragma once
#include <optional>
#include <string>

#include "chatlink/core/types.hpp"

namespace chatlink {

    /**
     * @struct BearerClaims
     * @brief Claims of interest decoded from a bearer token.
     */
    struct BearerClaims {
        std::string              subject;   ///< "sub": user id
        std::string              name;      ///< "name", empty if absent
        std::optional<Timestamp> expiresAt; ///< "exp", if present

        bool expired(Timestamp now) const { return expiresAt && *expiresAt <= now; }

        LocalUser user() const { return { subject, name }; }
    };

    /**
     * @brief Decode the payload of a JWT without verifying it.
     * @return std::nullopt if the token is not a well-formed JWT or has no subject
     */
    std::optional<BearerClaims> inspectBearer(const std::string& token);

}
