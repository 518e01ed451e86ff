/**
 * @file defaulter.cpp
 * @brief Profile and top-level defaulting passes.
 */
#include "schedcfg/defaults/defaulter.hpp"
#include "schedcfg/defaults/plugin_config.hpp"
#include "schedcfg/defaults/scalar_defaults.hpp"
#include "schedcfg/plugins/default_plugins.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace schedcfg::defaults {

namespace {

std::string profile_label(const api::Profile& profile, std::size_t index) {
    if (profile.scheduler_name && !profile.scheduler_name->empty()) return *profile.scheduler_name;
    return "#" + std::to_string(index);
}

} // namespace

std::string DefaultingError::message() const {
    return std::string(to_string(code)) + " (profile " + std::to_string(profile_index) + "): " + merge.detail;
}

Defaulter::Defaulter(std::shared_ptr<const registry::ArgsRegistry> registry,
                     std::shared_ptr<const plugins::PluginMerger> merger,
                     api::Plugins builtin,
                     const config::DefaultTable& table,
                     obs::Observer* observer)
    : registry_(std::move(registry)),
      merger_(std::move(merger)),
      builtin_(std::move(builtin)),
      table_(table),
      observer_(observer) {}

Defaulter::Defaulter(std::shared_ptr<const registry::ArgsRegistry> registry, obs::Observer* observer)
    : Defaulter(std::move(registry),
                std::make_shared<plugins::DefaultPluginMerger>(),
                plugins::default_plugins(),
                config::kDefaultTable,
                observer) {}

schedcfg_detail::expected<void, DefaultingError>
Defaulter::default_profile_at(api::Profile& profile, std::size_t index) const {
    auto merged = merger_->merge(builtin_, profile.plugins);
    if (!merged.has_value()) {
        return schedcfg_detail::unexpected(
            DefaultingError{DefaultingErr::MergeFailed, index, std::move(merged.error())});
    }
    profile.plugins = std::move(merged.value());

    const std::string label = profile_label(profile, index);
    complete_plugin_config(profile, *registry_, observer_, label);
    if (observer_ != nullptr) observer_->profile_done(label);
    return {};
}

schedcfg_detail::expected<void, DefaultingError>
Defaulter::default_profile(api::Profile& profile) const {
    api::Profile work = profile;
    auto r = default_profile_at(work, 0);
    if (!r.has_value()) return r;
    profile = std::move(work);
    return {};
}

schedcfg_detail::expected<void, DefaultingError>
Defaulter::default_configuration(api::Configuration& cfg) const {
    // Work on a copy so a failure leaves the caller's object untouched.
    api::Configuration work = cfg;

    set_parallelism_default(work, table_);

    if (work.profiles.empty()) work.profiles.emplace_back();
    // Only a single profile gets a default name; validation requires every
    // profile of a multi-profile configuration to be named.
    if (work.profiles.size() == 1 && !work.profiles.front().scheduler_name) {
        work.profiles.front().scheduler_name = std::string(table_.scheduler_name);
    }

    for (std::size_t i = 0; i < work.profiles.size(); ++i) {
        auto r = default_profile_at(work.profiles[i], i);
        if (!r.has_value()) {
            spdlog::error("defaulting aborted: {}", r.error().message());
            if (observer_ != nullptr) observer_->configuration_done(false);
            return r;
        }
    }

    apply_scalar_defaults(work, table_);

    cfg = std::move(work);
    if (observer_ != nullptr) observer_->configuration_done(true);
    spdlog::debug("configuration defaulted ({} profile(s))", cfg.profiles.size());
    return {};
}

std::string_view to_string(DefaultingErr e) noexcept {
    switch (e) {
        case DefaultingErr::MergeFailed: return "plugin merge failed";
    }
    return "unknown error";
}

} // namespace schedcfg::defaults
