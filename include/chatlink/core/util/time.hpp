/**
 * @file time.hpp
 * @brief Time utility functions for chatlink.
 *
 * ISO-8601 conversion for message timestamps exchanged with the server.
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace chatlink {

    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * @brief Parse an ISO-8601 / RFC 3339 date-time.
     *
     * Accepts `YYYY-MM-DDTHH:MM:SS`, an optional fraction of any length
     * (truncated to milliseconds), and a `Z` or `±HH:MM` / `±HHMM` offset.
     * A missing offset is read as UTC. A space separator is accepted in place of `T`.
     *
     * @param text Input text
     * @return Parsed time point, or std::nullopt if the text is not a valid date-time
     */
    std::optional<Timestamp> parseIso8601(std::string_view text);

    /**
     * @brief Format a time point as `YYYY-MM-DDTHH:MM:SS.mmmZ` (UTC).
     */
    std::string formatIso8601(Timestamp tp);

}
