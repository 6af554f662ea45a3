/**
 * @file random.hpp
 * @brief Random identifier helpers for chatlink.
 *
 * Client-side message ids are RFC 4122 version 4 UUIDs so that they never
 * collide with each other or with server-assigned ids.
 */
#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace chatlink {

    /**
     * @brief Fill a 16-byte array with random data.
     *
     * Uses a thread-local Mersenne Twister seeded with std::random_device and the clock.
     */
    inline void randomFill(std::array<uint8_t, 16>& tok)
    {
        static thread_local std::mt19937_64 rng{
            std::random_device{}() ^ (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count()
        };
        std::uniform_int_distribution<uint64_t> dist;

        for (size_t i = 0; i < 16; i += 8) {
            uint64_t rnd = dist(rng);
            for (size_t b = 0; b < 8; ++b)
                tok[i + b] = static_cast<uint8_t>((rnd >> (8 * b)) & 0xFF);
        }
    }

    /**
     * @brief Generate a lower-case canonical UUID v4 string (8-4-4-4-12).
     */
    inline std::string uuidV4()
    {
        std::array<uint8_t, 16> b{};
        randomFill(b);
        b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
        b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

        static constexpr char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
            out.push_back(hex[b[i] >> 4]);
            out.push_back(hex[b[i] & 0x0F]);
        }
        return out;
    }

}
