/**
 * @file feature_gate.cpp
 * @brief MapFeatureGate: known-feature table plus mutex-guarded overrides.
 */
#include "schedcfg/features/feature_gate.hpp"
#include "schedcfg/config/constants.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace schedcfg::features {
    using namespace schedcfg::config::constants;

    namespace {

    std::string_view trim(std::string_view s) noexcept {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
        return s;
    }

    } // namespace

    MapFeatureGate::KnownMap default_known_features() {
        return {
            {std::string(FEATURE_VOLUME_CAPACITY_PRIORITY), FeatureSpec{false, Stage::Alpha}},
        };
    }

    MapFeatureGate::MapFeatureGate() : MapFeatureGate(default_known_features()) {}

    MapFeatureGate::MapFeatureGate(KnownMap known) : known_(std::move(known)) {}

    bool MapFeatureGate::enabled(std::string_view name) const {
        std::lock_guard<std::mutex> lk(mu_);
        if (auto it = overrides_.find(name); it != overrides_.end()) return it->second;
        auto it = known_.find(name);
        return it != known_.end() && it->second.default_enabled;
    }

    schedcfg_detail::expected<void, FeatureErr> MapFeatureGate::set(std::string_view name, bool value) {
        if (known_.find(name) == known_.end()) {
            return schedcfg_detail::unexpected(FeatureErr::UnknownFeature);
        }
        std::lock_guard<std::mutex> lk(mu_);
        overrides_.insert_or_assign(std::string(name), value);
        spdlog::debug("feature gate {}={}", name, value);
        return {};
    }

    schedcfg_detail::expected<void, FeatureErr> MapFeatureGate::set_from_string(std::string_view list) {
        std::vector<std::pair<std::string_view, bool>> parsed;

        while (!list.empty()) {
            const auto comma = list.find(',');
            const auto item = trim(list.substr(0, comma));
            list = (comma == std::string_view::npos) ? std::string_view{} : list.substr(comma + 1);
            if (item.empty()) continue;

            const auto eq = item.find('=');
            if (eq == std::string_view::npos) return schedcfg_detail::unexpected(FeatureErr::Malformed);
            const auto key = trim(item.substr(0, eq));
            const auto val = trim(item.substr(eq + 1));
            if (key.empty()) return schedcfg_detail::unexpected(FeatureErr::Malformed);
            if (known_.find(key) == known_.end()) return schedcfg_detail::unexpected(FeatureErr::UnknownFeature);

            if (val == "true")       parsed.emplace_back(key, true);
            else if (val == "false") parsed.emplace_back(key, false);
            else return schedcfg_detail::unexpected(FeatureErr::BadValue);
        }

        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [k, v] : parsed) overrides_.insert_or_assign(std::string(k), v);
        return {};
    }

    std::vector<std::string> MapFeatureGate::known_features() const {
        std::vector<std::string> out;
        out.reserve(known_.size());
        for (const auto& kv : known_) out.push_back(kv.first);
        return out;
    }

    std::string_view to_string(FeatureErr e) noexcept {
        switch (e) {
            case FeatureErr::UnknownFeature: return "unknown feature";
            case FeatureErr::BadValue:       return "value must be true or false";
            case FeatureErr::Malformed:      return "expected Name=value";
        }
        return "unknown error";
    }

} // namespace schedcfg::features
