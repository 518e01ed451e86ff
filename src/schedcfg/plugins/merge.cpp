/**
 * @file merge.cpp
 * @brief DefaultPluginMerger: in-place replacement, append, disable.
 */
#include "schedcfg/plugins/merge.hpp"

#include <set>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace schedcfg::plugins {

api::PluginSet DefaultPluginMerger::merge_set(const api::PluginSet& defaults,
                                              const api::PluginSet& custom,
                                              api::ExtensionPoint ep) {
    api::PluginSet out;

    // Disabled entries keep only their names. The framework needs them to
    // know which defaults not to re-insert at multiPoint expansion.
    std::set<std::string_view> disabled;
    for (const auto& d : custom.disabled) {
        out.disabled.push_back(api::Plugin{d.name, std::nullopt});
        disabled.insert(d.name);
    }

    // Name -> index of the last custom enabled entry with that name.
    std::unordered_map<std::string_view, std::size_t> custom_index;
    for (std::size_t i = 0; i < custom.enabled.size(); ++i) {
        custom_index[custom.enabled[i].name] = i;
    }

    std::vector<bool> replaced(custom.enabled.size(), false);
    if (disabled.count(DISABLE_ALL) == 0) {
        for (const auto& def : defaults.enabled) {
            if (disabled.count(def.name) != 0) continue;
            auto it = custom_index.find(def.name);
            if (it == custom_index.end()) {
                out.enabled.push_back(def);
                continue;
            }
            spdlog::info("Default plugin is explicitly re-configured; overriding (plugin={}, extensionPoint={})",
                         def.name, api::to_string(ep));
            // Replace in place to preserve the default order.
            out.enabled.push_back(custom.enabled[it->second]);
            replaced[it->second] = true;
        }
    }

    for (std::size_t i = 0; i < custom.enabled.size(); ++i) {
        if (!replaced[i]) out.enabled.push_back(custom.enabled[i]);
    }
    return out;
}

schedcfg_detail::expected<api::Plugins, MergeError>
DefaultPluginMerger::merge(const api::Plugins& defaults, const std::optional<api::Plugins>& custom) const {
    if (!custom) return defaults;

    api::Plugins out;
    for (const auto ep : api::kExtensionPoints) {
        out.at(ep) = merge_set(defaults.at(ep), custom->at(ep), ep);
    }
    return out;
}

} // namespace schedcfg::plugins
