#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the scheduler configuration defaulting pass.
 * @details These values eliminate magic numbers from the codebase. The defaulting
 *          pass reads them through a single immutable DefaultTable so tests can
 *          substitute their own table.
 */

#include <chrono>
#include <cstdint>
#include <string_view>

namespace schedcfg::config::constants {

// =====================
// Scheduler identity
// =====================
/// Name assigned to the only profile of a single-profile configuration.
inline constexpr std::string_view DEFAULT_SCHEDULER_NAME = "default-scheduler";

// =====================
// Scheduling loop
// =====================
inline constexpr int32_t PARALLELISM                    = 16;  ///< Worker goroutines/threads for filtering/scoring
inline constexpr int32_t PERCENTAGE_OF_NODES_TO_SCORE   = 0;   ///< 0 = adaptive percentage
inline constexpr int64_t POD_INITIAL_BACKOFF_SECONDS    = 1;
inline constexpr int64_t POD_MAX_BACKOFF_SECONDS        = 10;
inline constexpr bool    ENABLE_PROFILING               = true;
inline constexpr bool    ENABLE_CONTENTION_PROFILING    = true; ///< Only when profiling is on

// =====================
// Leader election
// =====================
/// Lease-based lock; endpoints/configmap locks were retired.
inline constexpr std::string_view LEADER_ELECTION_RESOURCE_LOCK      = "leases";
inline constexpr std::string_view LEADER_ELECTION_RESOURCE_NAMESPACE = "kube-system";
inline constexpr std::string_view LEADER_ELECTION_RESOURCE_NAME      = "kube-scheduler";

// Recommended component defaults (shared by all control-plane components).
inline constexpr std::chrono::milliseconds LEADER_ELECTION_LEASE_DURATION{15000};
inline constexpr std::chrono::milliseconds LEADER_ELECTION_RENEW_DEADLINE{10000};
inline constexpr std::chrono::milliseconds LEADER_ELECTION_RETRY_PERIOD{2000};
inline constexpr std::string_view LEADER_ELECTION_RECOMMENDED_LOCK = "endpointsleases";
inline constexpr bool LEADER_ELECTION_LEADER_ELECT = true;

// =====================
// Client connection (scheduler-specific QPS/Burst opinion)
// =====================
inline constexpr std::string_view CLIENT_CONTENT_TYPE = "application/vnd.kubernetes.protobuf";
inline constexpr float   CLIENT_QPS   = 50.0F;
inline constexpr int32_t CLIENT_BURST = 100;

// =====================
// Plugin arguments
// =====================
/// Suffix appended to a plugin name to form its argument kind.
inline constexpr std::string_view ARGS_KIND_SUFFIX = "Args";

inline constexpr int32_t PREEMPTION_MIN_CANDIDATE_NODES_PERCENTAGE = 10;
inline constexpr int32_t PREEMPTION_MIN_CANDIDATE_NODES_ABSOLUTE   = 100;
inline constexpr int32_t INTER_POD_AFFINITY_HARD_WEIGHT            = 1;
inline constexpr int64_t VOLUME_BINDING_TIMEOUT_SECONDS            = 600;
inline constexpr int64_t RESOURCE_SPEC_WEIGHT                      = 1;  ///< Applied when weight is 0
inline constexpr int32_t MAX_CUSTOM_PRIORITY_SCORE                 = 10; ///< Upper bound of shape scores
inline constexpr int32_t MAX_UTILIZATION                           = 100;

inline constexpr std::string_view RESOURCE_CPU    = "cpu";
inline constexpr std::string_view RESOURCE_MEMORY = "memory";

// =====================
// Feature names
// =====================
inline constexpr std::string_view FEATURE_VOLUME_CAPACITY_PRIORITY = "VolumeCapacityPriority";

} // namespace schedcfg::config::constants

namespace schedcfg::config {

/** @struct DefaultTable
 *  @brief Scalar defaults applied by the top-level defaulting pass.
 *  @details Loaded once, never mutated. Field initializers reference the named
 *           constants above; kDefaultTable is the process-wide instance.
 */
struct DefaultTable {
    int32_t          parallelism{constants::PARALLELISM};
    int32_t          percentage_of_nodes_to_score{constants::PERCENTAGE_OF_NODES_TO_SCORE};
    std::string_view scheduler_name{constants::DEFAULT_SCHEDULER_NAME};

    std::string_view resource_lock{constants::LEADER_ELECTION_RESOURCE_LOCK};
    std::string_view resource_namespace{constants::LEADER_ELECTION_RESOURCE_NAMESPACE};
    std::string_view resource_name{constants::LEADER_ELECTION_RESOURCE_NAME};

    std::string_view content_type{constants::CLIENT_CONTENT_TYPE};
    float            qps{constants::CLIENT_QPS};
    int32_t          burst{constants::CLIENT_BURST};

    int64_t pod_initial_backoff_seconds{constants::POD_INITIAL_BACKOFF_SECONDS};
    int64_t pod_max_backoff_seconds{constants::POD_MAX_BACKOFF_SECONDS};
    bool    enable_profiling{constants::ENABLE_PROFILING};
    bool    enable_contention_profiling{constants::ENABLE_CONTENTION_PROFILING};
};

/// Process-wide immutable default table.
inline constexpr DefaultTable kDefaultTable{};

} // namespace schedcfg::config
