#pragma once
/**
 * @file builtin_kinds.hpp
 * @brief Default-fillers of the in-tree plugin argument kinds and their registration.
 */

#include <memory>

#include "schedcfg/api/args_types.hpp"
#include "schedcfg/features/feature_gate.hpp"
#include "schedcfg/registry/args_registry.hpp"

namespace schedcfg::registry {

/// minCandidateNodesPercentage=10, minCandidateNodesAbsolute=100 when unset.
void set_defaults(api::DefaultPreemptionArgs& args);

/// hardPodAffinityWeight=1 when unset.
void set_defaults(api::InterPodAffinityArgs& args);

/**
 * @brief Scoring strategy defaults for NodeResourcesFit.
 * @details Missing strategy becomes LeastAllocated over cpu/memory. An empty
 *          resource list gets cpu/memory. Weight 0 becomes 1.
 */
void set_defaults(api::NodeResourcesFitArgs& args);

/// cpu/memory with weight 1 when empty; otherwise weight 0 becomes 1.
void set_defaults(api::NodeResourcesBalancedAllocationArgs& args);

/// defaultingType=System when unset.
void set_defaults(api::PodTopologySpreadArgs& args);

/**
 * @brief bindTimeoutSeconds=600 when unset; the linear utilization shape
 *        {(0,0),(100,MAX_CUSTOM_PRIORITY_SCORE)} when the shape is empty and
 *        VolumeCapacityPriority is enabled at call time.
 */
void set_defaults(api::VolumeBindingArgs& args, const features::FeatureGate& gate);

/**
 * @brief Register every in-tree kind (defaulter, decoder, encoder).
 * @param gate Consulted each time VolumeBindingArgs is defaulted.
 * @return First failing RegistryErr, or RegistryErr::Ok.
 */
RegistryErr register_builtin_kinds(ArgsRegistry& reg,
                                   std::shared_ptr<const features::FeatureGate> gate);

} // namespace schedcfg::registry
