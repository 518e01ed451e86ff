/**
 * @file default_plugins.cpp
 * @brief Built-in multiPoint plugin list.
 */
#include "schedcfg/plugins/default_plugins.hpp"

#include <string>

namespace schedcfg::plugins {

namespace {

api::Plugin plugin(std::string_view name) {
    return api::Plugin{std::string(name), std::nullopt};
}

api::Plugin weighted(std::string_view name, int32_t weight) {
    return api::Plugin{std::string(name), weight};
}

} // namespace

api::Plugins default_plugins() {
    using namespace names;
    api::Plugins p;
    // Order matters: the framework runs multiPoint plugins in this order at
    // every extension point they implement.
    p.multi_point.enabled = {
        plugin(PRIORITY_SORT),
        plugin(NODE_UNSCHEDULABLE),
        plugin(NODE_NAME),
        weighted(TAINT_TOLERATION, 3),
        weighted(NODE_AFFINITY, 2),
        plugin(NODE_PORTS),
        weighted(NODE_RESOURCES_FIT, 1),
        plugin(VOLUME_RESTRICTIONS),
        plugin(EBS_LIMITS),
        plugin(GCE_PD_LIMITS),
        plugin(NODE_VOLUME_LIMITS),
        plugin(AZURE_DISK_LIMITS),
        plugin(VOLUME_BINDING),
        plugin(VOLUME_ZONE),
        weighted(POD_TOPOLOGY_SPREAD, 2),
        weighted(INTER_POD_AFFINITY, 2),
        plugin(DEFAULT_PREEMPTION),
        weighted(NODE_RESOURCES_BALANCED_ALLOCATION, 1),
        weighted(IMAGE_LOCALITY, 1),
        plugin(DEFAULT_BINDER),
    };
    return p;
}

} // namespace schedcfg::plugins
