#pragma once
/**
 * @file args_types.hpp
 * @brief Argument structures of the in-tree plugins that accept configuration.
 * @details Unset optional fields are filled by the registered default-fillers
 *          (see registry/builtin_kinds.hpp). Field names follow the YAML keys.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "schedcfg/api/plugin_args.hpp"

namespace schedcfg::api {

// =====================
// Shared building blocks
// =====================

/** @struct ResourceSpec
 *  @brief A named resource and its scoring weight (0 = unset).
 */
struct ResourceSpec {
    std::string name;
    int64_t     weight{0};

    bool operator==(const ResourceSpec&) const = default;
};

/** @struct UtilizationShapePoint
 *  @brief One point of a piecewise-linear utilization -> score function.
 */
struct UtilizationShapePoint {
    int32_t utilization{0}; ///< 0..100
    int32_t score{0};       ///< 0..MAX_CUSTOM_PRIORITY_SCORE

    bool operator==(const UtilizationShapePoint&) const = default;
};

/// Scoring strategy names accepted by NodeResourcesFit.
inline constexpr std::string_view LEAST_ALLOCATED              = "LeastAllocated";
inline constexpr std::string_view MOST_ALLOCATED               = "MostAllocated";
inline constexpr std::string_view REQUESTED_TO_CAPACITY_RATIO  = "RequestedToCapacityRatio";

/// PodTopologySpread defaulting types.
inline constexpr std::string_view SYSTEM_DEFAULTING = "System";
inline constexpr std::string_view LIST_DEFAULTING   = "List";

struct RequestedToCapacityRatioParam {
    std::vector<UtilizationShapePoint> shape;

    bool operator==(const RequestedToCapacityRatioParam&) const = default;
};

struct ScoringStrategy {
    std::string                                  type;
    std::vector<ResourceSpec>                    resources;
    std::optional<RequestedToCapacityRatioParam> requested_to_capacity_ratio;

    bool operator==(const ScoringStrategy&) const = default;
};

struct TopologySpreadConstraint {
    int32_t     max_skew{0};
    std::string topology_key;
    std::string when_unsatisfiable; ///< "DoNotSchedule" | "ScheduleAnyway"

    bool operator==(const TopologySpreadConstraint&) const = default;
};

struct NodeSelectorRequirement {
    std::string              key;
    std::string              op; ///< "In", "NotIn", "Exists", ...
    std::vector<std::string> values;

    bool operator==(const NodeSelectorRequirement&) const = default;
};

struct NodeSelectorTerm {
    std::vector<NodeSelectorRequirement> match_expressions;

    bool operator==(const NodeSelectorTerm&) const = default;
};

// =====================
// Plugin argument kinds
// =====================

class DefaultPreemptionArgs final : public PluginArgsBase<DefaultPreemptionArgs> {
public:
    static constexpr std::string_view kKind = "DefaultPreemptionArgs";

    std::optional<int32_t> min_candidate_nodes_percentage;
    std::optional<int32_t> min_candidate_nodes_absolute;

    bool operator==(const DefaultPreemptionArgs&) const = default;
};

class InterPodAffinityArgs final : public PluginArgsBase<InterPodAffinityArgs> {
public:
    static constexpr std::string_view kKind = "InterPodAffinityArgs";

    std::optional<int32_t> hard_pod_affinity_weight;
    bool ignore_preferred_terms_of_existing_pods{false};

    bool operator==(const InterPodAffinityArgs&) const = default;
};

class NodeResourcesFitArgs final : public PluginArgsBase<NodeResourcesFitArgs> {
public:
    static constexpr std::string_view kKind = "NodeResourcesFitArgs";

    std::vector<std::string>       ignored_resources;
    std::vector<std::string>       ignored_resource_groups;
    std::optional<ScoringStrategy> scoring_strategy;

    bool operator==(const NodeResourcesFitArgs&) const = default;
};

class NodeResourcesBalancedAllocationArgs final
    : public PluginArgsBase<NodeResourcesBalancedAllocationArgs> {
public:
    static constexpr std::string_view kKind = "NodeResourcesBalancedAllocationArgs";

    std::vector<ResourceSpec> resources;

    bool operator==(const NodeResourcesBalancedAllocationArgs&) const = default;
};

class PodTopologySpreadArgs final : public PluginArgsBase<PodTopologySpreadArgs> {
public:
    static constexpr std::string_view kKind = "PodTopologySpreadArgs";

    std::vector<TopologySpreadConstraint> default_constraints;
    std::string                           defaulting_type; ///< "" = unset

    bool operator==(const PodTopologySpreadArgs&) const = default;
};

class VolumeBindingArgs final : public PluginArgsBase<VolumeBindingArgs> {
public:
    static constexpr std::string_view kKind = "VolumeBindingArgs";

    std::optional<int64_t>             bind_timeout_seconds;
    std::vector<UtilizationShapePoint> shape;

    bool operator==(const VolumeBindingArgs&) const = default;
};

/// Accepted by NodeAffinity; has no default-filler.
class NodeAffinityArgs final : public PluginArgsBase<NodeAffinityArgs> {
public:
    static constexpr std::string_view kKind = "NodeAffinityArgs";

    /// addedAffinity.requiredDuringSchedulingIgnoredDuringExecution.nodeSelectorTerms
    std::vector<NodeSelectorTerm> added_required_terms;

    bool operator==(const NodeAffinityArgs&) const = default;
};

} // namespace schedcfg::api
