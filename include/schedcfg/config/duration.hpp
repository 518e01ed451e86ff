#pragma once
/**
 * @file duration.hpp
 * @brief Duration text used by the configuration format ("15s", "1m30s", "250ms").
 */

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace schedcfg::config {

/**
 * @brief Parse a sequence of <decimal><unit> terms, unit one of h, m, s, ms.
 * @return std::nullopt on malformed text or sub-millisecond precision.
 */
std::optional<std::chrono::milliseconds> parse_duration(std::string_view text);

/// Inverse of parse_duration for millisecond values: "15s", "1m30s", "1h0m0s", "250ms", "0s".
std::string format_duration(std::chrono::milliseconds d);

} // namespace schedcfg::config
