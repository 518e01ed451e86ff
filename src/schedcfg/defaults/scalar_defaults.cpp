/**
 * @file scalar_defaults.cpp
 * @brief Scalar defaults from the DefaultTable.
 */
#include "schedcfg/defaults/scalar_defaults.hpp"

#include <string>

namespace schedcfg::defaults {
    using namespace schedcfg::config::constants;

    void set_parallelism_default(api::Configuration& cfg, const config::DefaultTable& table) noexcept {
        if (!cfg.parallelism) cfg.parallelism = table.parallelism;
    }

    void apply_recommended_leader_election_defaults(api::LeaderElectionConfiguration& le) {
        using std::chrono::milliseconds;
        if (le.lease_duration == milliseconds::zero()) le.lease_duration = LEADER_ELECTION_LEASE_DURATION;
        if (le.renew_deadline == milliseconds::zero()) le.renew_deadline = LEADER_ELECTION_RENEW_DEADLINE;
        if (le.retry_period == milliseconds::zero())   le.retry_period   = LEADER_ELECTION_RETRY_PERIOD;
        if (le.resource_lock.empty()) le.resource_lock = std::string(LEADER_ELECTION_RECOMMENDED_LOCK);
        if (!le.leader_elect) le.leader_elect = LEADER_ELECTION_LEADER_ELECT;
    }

    void apply_scalar_defaults(api::Configuration& cfg, const config::DefaultTable& table) {
        if (!cfg.percentage_of_nodes_to_score) {
            cfg.percentage_of_nodes_to_score = table.percentage_of_nodes_to_score;
        }

        auto& le = cfg.leader_election;
        // Scheduler-specific lock settings go first; the recommended component
        // defaults below only fill what is still empty.
        if (le.resource_lock.empty())      le.resource_lock      = std::string(table.resource_lock);
        if (le.resource_namespace.empty()) le.resource_namespace = std::string(table.resource_namespace);
        if (le.resource_name.empty())      le.resource_name      = std::string(table.resource_name);

        auto& cc = cfg.client_connection;
        if (cc.content_type.empty()) cc.content_type = std::string(table.content_type);
        if (cc.qps == 0.0F)          cc.qps = table.qps;
        if (cc.burst == 0)           cc.burst = table.burst;

        apply_recommended_leader_election_defaults(le);

        if (!cfg.pod_initial_backoff_seconds) cfg.pod_initial_backoff_seconds = table.pod_initial_backoff_seconds;
        if (!cfg.pod_max_backoff_seconds)     cfg.pod_max_backoff_seconds     = table.pod_max_backoff_seconds;

        // Order-dependent: profiling must be resolved first.
        if (!cfg.enable_profiling) cfg.enable_profiling = table.enable_profiling;
        if (*cfg.enable_profiling && !cfg.enable_contention_profiling) {
            cfg.enable_contention_profiling = table.enable_contention_profiling;
        }
    }

} // namespace schedcfg::defaults
