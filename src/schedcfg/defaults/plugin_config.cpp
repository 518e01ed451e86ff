/**
 * @file plugin_config.cpp
 * @brief Default-fill existing plugin args and append the missing ones.
 */
#include "schedcfg/defaults/plugin_config.hpp"
#include "schedcfg/defaults/plugin_names.hpp"
#include "schedcfg/version.hpp"

#include <unordered_set>
#include <utility>
#include <variant>

namespace schedcfg::defaults {

namespace {

void emit(obs::Observer* observer, std::string_view label, const std::string& plugin,
          std::string_view kind, obs::Action action) {
    if (observer == nullptr) return;
    observer->record(obs::DefaultingEvent{std::string(label), plugin, std::string(kind), action});
}

} // namespace

void complete_plugin_config(api::Profile& profile,
                            const registry::ArgsRegistry& reg,
                            obs::Observer* observer,
                            std::string_view label) {
    std::unordered_set<std::string> existing;
    for (auto& pc : profile.plugin_config) {
        existing.insert(pc.name);
        auto* typed = std::get_if<api::TypedArgs>(&pc.args);
        if (typed == nullptr) {
            // Structure unknown; validation reports problems later.
            emit(observer, label, pc.name, std::get<api::OpaqueArgs>(pc.args).kind, obs::Action::OpaqueSkipped);
            continue;
        }
        reg.apply_defaults(*typed);
        emit(observer, label, pc.name, typed->kind(), obs::Action::ArgsDefaulted);
    }

    for (const auto& name : plugin_names(profile.plugins)) {
        if (existing.count(name) != 0) continue;

        const std::string kind = registry::args_kind_for(name);
        auto args = reg.make(kind);
        if (!args) {
            emit(observer, label, name, {}, obs::Action::NoArgsKind);
            continue;
        }
        reg.apply_defaults(*args);
        args->set_api_version(schedcfg::api_version);
        profile.plugin_config.push_back(api::PluginConfig{name, api::ArgsObject{std::move(*args)}});
        emit(observer, label, name, kind, obs::Action::ArgsAppended);
    }
}

} // namespace schedcfg::defaults
