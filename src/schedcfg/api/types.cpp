/**
 * @file types.cpp
 * @brief Extension point naming and PluginSet lookup.
 */
#include "schedcfg/api/types.hpp"

namespace schedcfg::api {

std::string_view to_string(ExtensionPoint ep) noexcept {
    switch (ep) {
        case ExtensionPoint::MultiPoint: return "multiPoint";
        case ExtensionPoint::PreFilter:  return "preFilter";
        case ExtensionPoint::Filter:     return "filter";
        case ExtensionPoint::PostFilter: return "postFilter";
        case ExtensionPoint::Reserve:    return "reserve";
        case ExtensionPoint::PreScore:   return "preScore";
        case ExtensionPoint::Score:      return "score";
        case ExtensionPoint::PreBind:    return "preBind";
        case ExtensionPoint::Bind:       return "bind";
        case ExtensionPoint::PostBind:   return "postBind";
        case ExtensionPoint::Permit:     return "permit";
        case ExtensionPoint::QueueSort:  return "queueSort";
    }
    return "unknown";
}

PluginSet& Plugins::at(ExtensionPoint ep) noexcept {
    // Reuse the const overload; the object itself is non-const.
    return const_cast<PluginSet&>(static_cast<const Plugins&>(*this).at(ep));
}

const PluginSet& Plugins::at(ExtensionPoint ep) const noexcept {
    switch (ep) {
        case ExtensionPoint::MultiPoint: return multi_point;
        case ExtensionPoint::PreFilter:  return pre_filter;
        case ExtensionPoint::Filter:     return filter;
        case ExtensionPoint::PostFilter: return post_filter;
        case ExtensionPoint::Reserve:    return reserve;
        case ExtensionPoint::PreScore:   return pre_score;
        case ExtensionPoint::Score:      return score;
        case ExtensionPoint::PreBind:    return pre_bind;
        case ExtensionPoint::Bind:       return bind;
        case ExtensionPoint::PostBind:   return post_bind;
        case ExtensionPoint::Permit:     return permit;
        case ExtensionPoint::QueueSort:  return queue_sort;
    }
    return multi_point;
}

} // namespace schedcfg::api
