#pragma once
/**
 * @file scalar_defaults.hpp
 * @brief Field-level defaults of the top-level configuration.
 * @details Every assignment is guarded by an "unset" check, so applying any of
 *          these twice is a no-op.
 */

#include "schedcfg/api/types.hpp"
#include "schedcfg/config/constants.hpp"

namespace schedcfg::defaults {

/// parallelism when unset.
void set_parallelism_default(api::Configuration& cfg,
                             const config::DefaultTable& table = config::kDefaultTable) noexcept;

/**
 * @brief Everything except parallelism and profiles: percentage of nodes to
 *        score, leader election, client connection, backoff, profiling.
 * @note Contention profiling is defaulted only when profiling ends up enabled.
 */
void apply_scalar_defaults(api::Configuration& cfg,
                           const config::DefaultTable& table = config::kDefaultTable);

/**
 * @brief Defaults shared by every control-plane component: lease duration,
 *        renew deadline, retry period, resource lock, leaderElect.
 */
void apply_recommended_leader_election_defaults(api::LeaderElectionConfiguration& le);

} // namespace schedcfg::defaults
