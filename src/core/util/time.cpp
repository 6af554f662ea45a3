#include "chatlink/core/util/time.hpp"
#include <cctype>
#include <format>

namespace chatlink {

    namespace {

        /* reads exactly n digits at pos, advancing pos */
        bool readDigits(std::string_view s, std::size_t& pos, std::size_t n, int& out) {
            if (pos + n > s.size()) return false;
            int v = 0;
            for (std::size_t i = 0; i < n; ++i) {
                char c = s[pos + i];
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
                v = v * 10 + (c - '0');
            }
            out = v;
            pos += n;
            return true;
        }

        bool expect(std::string_view s, std::size_t& pos, char c) {
            if (pos >= s.size() || s[pos] != c) return false;
            ++pos;
            return true;
        }
    }

    std::optional<Timestamp> parseIso8601(std::string_view s) {
        std::size_t pos = 0;
        int year, month, day, hour, minute, second;

        if (!readDigits(s, pos, 4, year) || !expect(s, pos, '-') ||
            !readDigits(s, pos, 2, month) || !expect(s, pos, '-') ||
            !readDigits(s, pos, 2, day))
            return std::nullopt;

        if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' '))
            return std::nullopt;
        ++pos;

        if (!readDigits(s, pos, 2, hour) || !expect(s, pos, ':') ||
            !readDigits(s, pos, 2, minute) || !expect(s, pos, ':') ||
            !readDigits(s, pos, 2, second))
            return std::nullopt;

        using namespace std::chrono;
        year_month_day ymd{ std::chrono::year{ year }, std::chrono::month{ static_cast<unsigned>(month) },
                            std::chrono::day{ static_cast<unsigned>(day) } };
        if (!ymd.ok()) return std::nullopt;
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

        int millis = 0;
        if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
            ++pos;
            std::size_t digits = 0;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                if (digits < 3) millis = millis * 10 + (s[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (std::size_t i = digits; i < 3; ++i) millis *= 10;
        }

        int offsetMinutes = 0;
        if (pos < s.size()) {
            char c = s[pos];
            if (c == 'Z' || c == 'z') {
                ++pos;
            } else if (c == '+' || c == '-') {
                ++pos;
                int oh, om = 0;
                if (!readDigits(s, pos, 2, oh)) return std::nullopt;
                /* +HH, +HHMM or +HH:MM */
                if (pos < s.size() && s[pos] == ':') {
                    ++pos;
                    if (!readDigits(s, pos, 2, om)) return std::nullopt;
                } else if (pos < s.size() && !readDigits(s, pos, 2, om)) {
                    return std::nullopt;
                }
                if (oh > 23 || om > 59) return std::nullopt;
                offsetMinutes = (oh * 60 + om) * (c == '-' ? -1 : 1);
            } else {
                return std::nullopt;
            }
        }
        if (pos != s.size()) return std::nullopt;

        auto tp = sys_days{ ymd } +
                  hours{ hour } + minutes{ minute } + seconds{ second } +
                  milliseconds{ millis } - minutes{ offsetMinutes };
        return time_point_cast<system_clock::duration>(tp);
    }

    std::string formatIso8601(Timestamp tp) {
        using namespace std::chrono;
        auto ms = time_point_cast<milliseconds>(tp);
        auto dp = floor<std::chrono::days>(ms);
        year_month_day ymd{ dp };
        hh_mm_ss tod{ ms - dp };
        return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
            static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
            static_cast<unsigned>(ymd.day()), tod.hours().count(),
            tod.minutes().count(), tod.seconds().count(),
            tod.subseconds().count());
    }

}
