/**
 * @file duration.cpp
 * @brief Duration parsing/formatting in the h/m/s/ms notation.
 */
#include "schedcfg/config/duration.hpp"

#include <cstdint>
#include <limits>

namespace schedcfg::config {

std::optional<std::chrono::milliseconds> parse_duration(std::string_view text) {
    if (text.empty()) return std::nullopt;
    if (text == "0") return std::chrono::milliseconds{0};

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t total_us = 0; // microseconds, to keep fractional terms exact
    while (!text.empty()) {
        int64_t whole = 0;
        int64_t frac = 0;
        int64_t frac_scale = 1;
        bool digits = false;
        std::size_t i = 0;
        for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i) {
            const int64_t digit = text[i] - '0';
            if (whole > (kMax - digit) / 10) return std::nullopt;
            whole = whole * 10 + digit;
            digits = true;
        }
        if (i < text.size() && text[i] == '.') {
            for (++i; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i) {
                if (frac_scale < 1000000) {
                    frac = frac * 10 + (text[i] - '0');
                    frac_scale *= 10;
                }
                digits = true;
            }
        }
        if (!digits) return std::nullopt;
        text.remove_prefix(i);

        int64_t unit_us = 0;
        if (text.substr(0, 2) == "ms")     { unit_us = 1000;        text.remove_prefix(2); }
        else if (text.substr(0, 1) == "h") { unit_us = 3600000000;  text.remove_prefix(1); }
        else if (text.substr(0, 1) == "m") { unit_us = 60000000;    text.remove_prefix(1); }
        else if (text.substr(0, 1) == "s") { unit_us = 1000000;     text.remove_prefix(1); }
        else return std::nullopt;

        // The fractional part adds less than one unit_us and frac * unit_us < 3.6e15.
        if (whole >= kMax / unit_us) return std::nullopt;
        const int64_t term = whole * unit_us + (frac * unit_us) / frac_scale;
        if (total_us > kMax - term) return std::nullopt;
        total_us += term;
    }
    if (total_us % 1000 != 0) return std::nullopt;
    return std::chrono::milliseconds{total_us / 1000};
}

std::string format_duration(std::chrono::milliseconds d) {
    int64_t ms = d.count();
    std::string out;
    if (ms < 0) {
        out += '-';
        ms = -ms;
    }
    if (ms == 0) return "0s";
    if (ms < 1000) return out + std::to_string(ms) + "ms";

    const int64_t h = ms / 3600000;
    const int64_t m = (ms / 60000) % 60;
    const int64_t s = (ms / 1000) % 60;
    const int64_t rem = ms % 1000;

    if (h > 0) out += std::to_string(h) + "h";
    if (h > 0 || m > 0) out += std::to_string(m) + "m";
    out += std::to_string(s);
    if (rem != 0) {
        std::string f = std::to_string(rem);
        f.insert(0, 3 - f.size(), '0');
        while (!f.empty() && f.back() == '0') f.pop_back();
        out += "." + f;
    }
    out += "s";
    return out;
}

} // namespace schedcfg::config
