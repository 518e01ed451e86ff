#pragma once
/**
 * @file default_plugins.hpp
 * @brief Built-in plugin pipeline every profile starts from.
 */

#include <string_view>

#include "schedcfg/api/types.hpp"

namespace schedcfg::plugins {

/// In-tree plugin names.
namespace names {
inline constexpr std::string_view PRIORITY_SORT                      = "PrioritySort";
inline constexpr std::string_view NODE_UNSCHEDULABLE                 = "NodeUnschedulable";
inline constexpr std::string_view NODE_NAME                          = "NodeName";
inline constexpr std::string_view TAINT_TOLERATION                   = "TaintToleration";
inline constexpr std::string_view NODE_AFFINITY                      = "NodeAffinity";
inline constexpr std::string_view NODE_PORTS                         = "NodePorts";
inline constexpr std::string_view NODE_RESOURCES_FIT                 = "NodeResourcesFit";
inline constexpr std::string_view VOLUME_RESTRICTIONS                = "VolumeRestrictions";
inline constexpr std::string_view EBS_LIMITS                         = "EBSLimits";
inline constexpr std::string_view GCE_PD_LIMITS                      = "GCEPDLimits";
inline constexpr std::string_view NODE_VOLUME_LIMITS                 = "NodeVolumeLimits";
inline constexpr std::string_view AZURE_DISK_LIMITS                  = "AzureDiskLimits";
inline constexpr std::string_view VOLUME_BINDING                     = "VolumeBinding";
inline constexpr std::string_view VOLUME_ZONE                        = "VolumeZone";
inline constexpr std::string_view POD_TOPOLOGY_SPREAD                = "PodTopologySpread";
inline constexpr std::string_view INTER_POD_AFFINITY                 = "InterPodAffinity";
inline constexpr std::string_view DEFAULT_PREEMPTION                 = "DefaultPreemption";
inline constexpr std::string_view NODE_RESOURCES_BALANCED_ALLOCATION = "NodeResourcesBalancedAllocation";
inline constexpr std::string_view IMAGE_LOCALITY                     = "ImageLocality";
inline constexpr std::string_view DEFAULT_BINDER                     = "DefaultBinder";
} // namespace names

/**
 * @brief The default pipeline: every in-tree plugin enabled at multiPoint,
 *        scoring plugins carrying their default weights. Other points are empty.
 */
api::Plugins default_plugins();

} // namespace schedcfg::plugins
