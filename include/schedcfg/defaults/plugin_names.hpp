#pragma once
/**
 * @file plugin_names.hpp
 * @brief Distinct plugin names enabled anywhere in a pipeline.
 */

#include <optional>
#include <string>
#include <vector>

#include "schedcfg/api/types.hpp"

namespace schedcfg::defaults {

/**
 * @brief Union of enabled plugin names over every extension point.
 * @return Sorted, duplicate-free names; empty for an absent pipeline.
 */
std::vector<std::string> plugin_names(const std::optional<api::Plugins>& plugins);

} // namespace schedcfg::defaults
