#pragma once
/**
 * @file plugin_config.hpp
 * @brief Completion of a profile's plugin argument list.
 */

#include <string>
#include <string_view>

#include "schedcfg/api/types.hpp"
#include "schedcfg/obs/observability.hpp"
#include "schedcfg/registry/args_registry.hpp"

namespace schedcfg::defaults {

/**
 * @brief Default existing args and append defaulted args for the rest.
 *
 * 1. Every existing typed entry is default-filled in place, in list order.
 *    Opaque entries are left untouched.
 * 2. For each enabled plugin name (sorted) without an entry, the registry is
 *    asked for registry::args_kind_for(name). A miss is skipped: the plugin takes no
 *    arguments or is built out of tree. A hit is default-filled, tagged with
 *    the API version and appended.
 *
 * Never removes or reorders entries.
 *
 * @param observer Optional event sink.
 * @param label Profile label used in events.
 */
void complete_plugin_config(api::Profile& profile,
                            const registry::ArgsRegistry& reg,
                            obs::Observer* observer = nullptr,
                            std::string_view label = {});

} // namespace schedcfg::defaults
