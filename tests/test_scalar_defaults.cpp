/**
 * @file test_scalar_defaults.cpp
 * @brief Tests for top-level scalar defaults.
 *
 * Validates:
 *  - Empty configuration receives every constant of the default table
 *  - Already-set fields (including explicit false) are never overwritten
 *  - Contention profiling follows the resolved profiling flag
 *  - A substituted DefaultTable is honored
 */

#include <gtest/gtest.h>

#include "schedcfg/api/types.hpp"
#include "schedcfg/config/constants.hpp"
#include "schedcfg/defaults/scalar_defaults.hpp"

using namespace std::chrono_literals;
using schedcfg::api::Configuration;
using schedcfg::api::LeaderElectionConfiguration;
using schedcfg::config::DefaultTable;
using schedcfg::defaults::apply_recommended_leader_election_defaults;
using schedcfg::defaults::apply_scalar_defaults;
using schedcfg::defaults::set_parallelism_default;

// --------------------------- Empty configuration ---------------------------

/**
 * @test Scalar_EmptyConfiguration_GetsDefaults
 * @brief Every unset scalar receives the table value.
 */
TEST(ScalarDefaults, EmptyConfiguration_GetsDefaults) {
  Configuration cfg;
  set_parallelism_default(cfg);
  apply_scalar_defaults(cfg);

  ASSERT_TRUE(cfg.parallelism);
  EXPECT_EQ(*cfg.parallelism, 16);
  ASSERT_TRUE(cfg.percentage_of_nodes_to_score);
  EXPECT_EQ(*cfg.percentage_of_nodes_to_score, 0);

  EXPECT_EQ(cfg.leader_election.resource_lock, "leases");
  EXPECT_EQ(cfg.leader_election.resource_namespace, "kube-system");
  EXPECT_EQ(cfg.leader_election.resource_name, "kube-scheduler");
  ASSERT_TRUE(cfg.leader_election.leader_elect);
  EXPECT_TRUE(*cfg.leader_election.leader_elect);
  EXPECT_EQ(cfg.leader_election.lease_duration, 15s);
  EXPECT_EQ(cfg.leader_election.renew_deadline, 10s);
  EXPECT_EQ(cfg.leader_election.retry_period, 2s);

  EXPECT_EQ(cfg.client_connection.content_type, "application/vnd.kubernetes.protobuf");
  EXPECT_FLOAT_EQ(cfg.client_connection.qps, 50.0F);
  EXPECT_EQ(cfg.client_connection.burst, 100);

  ASSERT_TRUE(cfg.pod_initial_backoff_seconds);
  EXPECT_EQ(*cfg.pod_initial_backoff_seconds, 1);
  ASSERT_TRUE(cfg.pod_max_backoff_seconds);
  EXPECT_EQ(*cfg.pod_max_backoff_seconds, 10);

  ASSERT_TRUE(cfg.enable_profiling);
  EXPECT_TRUE(*cfg.enable_profiling);
  ASSERT_TRUE(cfg.enable_contention_profiling);
  EXPECT_TRUE(*cfg.enable_contention_profiling);
}

// --------------------------- Explicit values -------------------------------

/**
 * @test Scalar_ExplicitValues_Preserved
 * @brief Values set by the operator survive, including explicit zero percentage.
 */
TEST(ScalarDefaults, ExplicitValues_Preserved) {
  Configuration cfg;
  cfg.parallelism = 4;
  cfg.percentage_of_nodes_to_score = 35;
  cfg.leader_election.resource_lock = "leases";
  cfg.leader_election.resource_namespace = "scheduling";
  cfg.leader_election.resource_name = "my-scheduler";
  cfg.leader_election.leader_elect = false;
  cfg.leader_election.lease_duration = 30s;
  cfg.client_connection.content_type = "application/json";
  cfg.client_connection.qps = 5.0F;
  cfg.client_connection.burst = 7;
  cfg.pod_initial_backoff_seconds = 3;
  cfg.pod_max_backoff_seconds = 30;

  set_parallelism_default(cfg);
  apply_scalar_defaults(cfg);

  EXPECT_EQ(*cfg.parallelism, 4);
  EXPECT_EQ(*cfg.percentage_of_nodes_to_score, 35);
  EXPECT_EQ(cfg.leader_election.resource_namespace, "scheduling");
  EXPECT_EQ(cfg.leader_election.resource_name, "my-scheduler");
  EXPECT_FALSE(*cfg.leader_election.leader_elect);
  EXPECT_EQ(cfg.leader_election.lease_duration, 30s);
  EXPECT_EQ(cfg.leader_election.renew_deadline, 10s);
  EXPECT_EQ(cfg.client_connection.content_type, "application/json");
  EXPECT_FLOAT_EQ(cfg.client_connection.qps, 5.0F);
  EXPECT_EQ(cfg.client_connection.burst, 7);
  EXPECT_EQ(*cfg.pod_initial_backoff_seconds, 3);
  EXPECT_EQ(*cfg.pod_max_backoff_seconds, 30);
}

// --------------------------- Profiling order -------------------------------

/**
 * @test Scalar_ProfilingDisabled_NoContentionDefault
 * @brief With profiling explicitly off, contention profiling stays unset.
 */
TEST(ScalarDefaults, ProfilingDisabled_NoContentionDefault) {
  Configuration cfg;
  cfg.enable_profiling = false;
  apply_scalar_defaults(cfg);

  EXPECT_FALSE(*cfg.enable_profiling);
  EXPECT_FALSE(cfg.enable_contention_profiling.has_value());
}

/**
 * @test Scalar_ContentionExplicitFalse_Preserved
 * @brief Explicit contention=false survives while profiling defaults to true.
 */
TEST(ScalarDefaults, ContentionExplicitFalse_Preserved) {
  Configuration cfg;
  cfg.enable_contention_profiling = false;
  apply_scalar_defaults(cfg);

  EXPECT_TRUE(*cfg.enable_profiling);
  EXPECT_FALSE(*cfg.enable_contention_profiling);
}

// --------------------------- Table substitution ----------------------------

/**
 * @test Scalar_SubstitutedTable_Used
 * @brief The pass reads only the table it is given.
 */
TEST(ScalarDefaults, SubstitutedTable_Used) {
  DefaultTable table;
  table.parallelism = 2;
  table.qps = 10.0F;
  table.burst = 20;
  table.enable_profiling = false;

  Configuration cfg;
  set_parallelism_default(cfg, table);
  apply_scalar_defaults(cfg, table);

  EXPECT_EQ(*cfg.parallelism, 2);
  EXPECT_FLOAT_EQ(cfg.client_connection.qps, 10.0F);
  EXPECT_EQ(cfg.client_connection.burst, 20);
  EXPECT_FALSE(*cfg.enable_profiling);
  EXPECT_FALSE(cfg.enable_contention_profiling.has_value());
}

/**
 * @test Scalar_Idempotent
 * @brief A second application changes nothing.
 */
TEST(ScalarDefaults, Idempotent) {
  Configuration cfg;
  apply_scalar_defaults(cfg);
  const Configuration once = cfg;
  apply_scalar_defaults(cfg);
  EXPECT_EQ(cfg, once);
}

// --------------------------- Recommended leader election -------------------

/**
 * @test LeaderElection_Recommended_FillsLockWhenEmpty
 * @brief On its own, the component default lock is endpointsleases.
 */
TEST(ScalarDefaults, LeaderElection_Recommended_FillsLockWhenEmpty) {
  LeaderElectionConfiguration le;
  apply_recommended_leader_election_defaults(le);
  EXPECT_EQ(le.resource_lock, "endpointsleases");
  EXPECT_EQ(le.lease_duration, 15s);
  EXPECT_TRUE(*le.leader_elect);
}
