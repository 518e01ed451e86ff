/**
 * @file plugin_names.cpp
 * @brief Enabled-name collection across extension points.
 */
#include "schedcfg/defaults/plugin_names.hpp"

#include <set>

namespace schedcfg::defaults {

std::vector<std::string> plugin_names(const std::optional<api::Plugins>& plugins) {
    if (!plugins) return {};

    // Sorted output keeps appended plugin configs diff-stable.
    std::set<std::string> names;
    for (const auto ep : api::kExtensionPoints) {
        for (const auto& p : plugins->at(ep).enabled) names.insert(p.name);
    }
    return {names.begin(), names.end()};
}

} // namespace schedcfg::defaults
