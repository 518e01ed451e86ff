/**
 * @file test_defaulter.cpp
 * @brief Tests for the profile and configuration defaulting passes.
 *
 * Validates:
 *  - Empty configuration gets one named profile, the full pipeline and scalars
 *  - Only a lone unnamed profile is named
 *  - Idempotence and preservation of user values
 *  - Merge failures abort the pass and leave the configuration untouched
 *  - VolumeBinding shape follows the feature gate at call time
 */

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>

#include "schedcfg/api/args_types.hpp"
#include "schedcfg/defaults/defaulter.hpp"
#include "schedcfg/features/feature_gate.hpp"
#include "schedcfg/plugins/default_plugins.hpp"
#include "schedcfg/registry/builtin_kinds.hpp"
#include "schedcfg/version.hpp"

using namespace schedcfg;
using api::Plugin;

namespace {

/// Merger that refuses every override naming "Forbidden".
class RejectingMerger final : public plugins::PluginMerger {
public:
  schedcfg_detail::expected<api::Plugins, plugins::MergeError>
  merge(const api::Plugins& defaults, const std::optional<api::Plugins>& custom) const override {
    if (custom) {
      for (const auto& p : custom->multi_point.enabled) {
        if (p.name == "Forbidden") {
          return schedcfg_detail::unexpected(
              plugins::MergeError{plugins::MergeErr::Rejected, "Forbidden is not allowed"});
        }
      }
    }
    return inner_.merge(defaults, custom);
  }

private:
  plugins::DefaultPluginMerger inner_;
};

/// Counts end-of-pass notifications.
class PassObserver final : public obs::Observer {
public:
  void record(const obs::DefaultingEvent&) override { ++events; }
  void profile_done(const std::string& p) override { profiles.insert(p); }
  void configuration_done(bool ok) override { ok ? ++ok_passes : ++failed_passes; }
  obs::Counters snapshot() const override { return {}; }

  int events{0};
  std::set<std::string> profiles;
  int ok_passes{0};
  int failed_passes{0};
};

struct Fixture {
  std::shared_ptr<features::MapFeatureGate> gate = std::make_shared<features::MapFeatureGate>();
  std::shared_ptr<registry::ArgsRegistry> reg = std::make_shared<registry::ArgsRegistry>();

  Fixture() {
    EXPECT_EQ(registry::register_builtin_kinds(*reg, gate), registry::RegistryErr::Ok);
  }
};

const api::TypedArgs* find_typed(const api::Profile& p, std::string_view name) {
  for (const auto& pc : p.plugin_config) {
    if (pc.name == name) return std::get_if<api::TypedArgs>(&pc.args);
  }
  return nullptr;
}

} // namespace

// --------------------------- Empty configuration ---------------------------

/**
 * @test Defaulter_EmptyConfiguration_Complete
 * @brief An empty document defaults to one "default-scheduler" profile with
 *        every argument-taking built-in plugin configured.
 */
TEST(Defaulter, EmptyConfiguration_Complete) {
  Fixture f;
  PassObserver obs;
  defaults::Defaulter d(f.reg, &obs);

  api::Configuration cfg;
  ASSERT_TRUE(d.default_configuration(cfg).has_value());

  EXPECT_EQ(cfg.parallelism, 16);
  EXPECT_EQ(cfg.percentage_of_nodes_to_score, 0);
  EXPECT_EQ(cfg.pod_initial_backoff_seconds, 1);
  EXPECT_EQ(cfg.pod_max_backoff_seconds, 10);
  EXPECT_EQ(cfg.enable_profiling, true);
  EXPECT_EQ(cfg.enable_contention_profiling, true);
  EXPECT_EQ(cfg.leader_election.leader_elect, true);
  EXPECT_EQ(cfg.leader_election.resource_lock, "leases");
  EXPECT_EQ(cfg.leader_election.resource_name, "kube-scheduler");
  EXPECT_EQ(cfg.leader_election.resource_namespace, "kube-system");
  EXPECT_EQ(cfg.client_connection.content_type, "application/vnd.kubernetes.protobuf");
  EXPECT_FLOAT_EQ(cfg.client_connection.qps, 50.0F);
  EXPECT_EQ(cfg.client_connection.burst, 100);

  ASSERT_EQ(cfg.profiles.size(), 1u);
  const auto& p = cfg.profiles[0];
  EXPECT_EQ(p.scheduler_name, "default-scheduler");
  ASSERT_TRUE(p.plugins.has_value());
  EXPECT_EQ(p.plugins.value(), plugins::default_plugins());

  std::vector<std::string> names;
  for (const auto& pc : p.plugin_config) names.push_back(pc.name);
  EXPECT_EQ(names, (std::vector<std::string>{"DefaultPreemption", "InterPodAffinity", "NodeAffinity",
                                             "NodeResourcesBalancedAllocation", "NodeResourcesFit",
                                             "PodTopologySpread", "VolumeBinding"}));
  for (const auto& pc : p.plugin_config) {
    ASSERT_TRUE(api::is_typed(pc.args)) << pc.name;
    EXPECT_EQ(std::get<api::TypedArgs>(pc.args).api_version(), schedcfg::api_version);
  }

  EXPECT_EQ(obs.ok_passes, 1);
  EXPECT_EQ(obs.profiles, (std::set<std::string>{"default-scheduler"}));
}

// --------------------------- Profile naming -------------------------------

TEST(Defaulter, TwoUnnamedProfiles_StayUnnamed) {
  Fixture f;
  defaults::Defaulter d(f.reg);

  api::Configuration cfg;
  cfg.profiles.resize(2);
  ASSERT_TRUE(d.default_configuration(cfg).has_value());
  ASSERT_EQ(cfg.profiles.size(), 2u);
  EXPECT_FALSE(cfg.profiles[0].scheduler_name.has_value());
  EXPECT_FALSE(cfg.profiles[1].scheduler_name.has_value());
  EXPECT_TRUE(cfg.profiles[0].plugins.has_value());
  EXPECT_TRUE(cfg.profiles[1].plugins.has_value());
}

TEST(Defaulter, SingleNamedProfile_KeepsName) {
  Fixture f;
  defaults::Defaulter d(f.reg);

  api::Configuration cfg;
  cfg.profiles.emplace_back();
  cfg.profiles[0].scheduler_name = "custom";
  ASSERT_TRUE(d.default_configuration(cfg).has_value());
  EXPECT_EQ(cfg.profiles[0].scheduler_name, "custom");
}

// --------------------------- User values ----------------------------------

/**
 * @test Defaulter_UserValuesPreserved
 * @brief Explicit scalars and args survive; profiling off suppresses contention profiling.
 */
TEST(Defaulter, UserValuesPreserved) {
  Fixture f;
  defaults::Defaulter d(f.reg);

  api::Configuration cfg;
  cfg.parallelism = 4;
  cfg.enable_profiling = false;
  cfg.leader_election.leader_elect = false;
  cfg.leader_election.resource_lock = "endpoints";

  api::Profile p;
  api::VolumeBindingArgs vb;
  vb.bind_timeout_seconds = 30;
  p.plugin_config.push_back(api::PluginConfig{"VolumeBinding", api::make_typed(vb)});
  cfg.profiles.push_back(std::move(p));

  ASSERT_TRUE(d.default_configuration(cfg).has_value());
  EXPECT_EQ(cfg.parallelism, 4);
  EXPECT_EQ(cfg.enable_profiling, false);
  EXPECT_FALSE(cfg.enable_contention_profiling.has_value());
  EXPECT_EQ(cfg.leader_election.leader_elect, false);
  EXPECT_EQ(cfg.leader_election.resource_lock, "endpoints");

  const auto& prof = cfg.profiles[0];
  EXPECT_EQ(prof.plugin_config.front().name, "VolumeBinding");
  const auto* typed = find_typed(prof, "VolumeBinding");
  ASSERT_NE(typed, nullptr);
  EXPECT_EQ(typed->get<api::VolumeBindingArgs>()->bind_timeout_seconds, 30);
}

/**
 * @test Defaulter_Idempotent
 * @brief Defaulting an already defaulted configuration changes nothing.
 */
TEST(Defaulter, Idempotent) {
  Fixture f;
  defaults::Defaulter d(f.reg);

  api::Configuration cfg;
  cfg.profiles.emplace_back();
  cfg.profiles[0].plugins.emplace();
  cfg.profiles[0].plugins->multi_point.disabled = {Plugin{"ImageLocality", std::nullopt}};
  cfg.profiles[0].plugins->multi_point.enabled = {Plugin{"NodeAffinity", 5}};

  ASSERT_TRUE(d.default_configuration(cfg).has_value());
  const api::Configuration once = cfg;
  ASSERT_TRUE(d.default_configuration(cfg).has_value());
  EXPECT_EQ(cfg, once);
}

// --------------------------- Failures -------------------------------------

/**
 * @test Defaulter_MergeFailure_Transactional
 * @brief A rejected override aborts the pass; no field of the input changes.
 */
TEST(Defaulter, MergeFailure_Transactional) {
  Fixture f;
  PassObserver obs;
  defaults::Defaulter d(f.reg, std::make_shared<RejectingMerger>(), plugins::default_plugins(),
                        config::kDefaultTable, &obs);

  api::Configuration cfg;
  cfg.profiles.resize(2);
  cfg.profiles[0].scheduler_name = "first";
  cfg.profiles[1].scheduler_name = "second";
  cfg.profiles[1].plugins.emplace();
  cfg.profiles[1].plugins->multi_point.enabled = {Plugin{"Forbidden", std::nullopt}};
  const api::Configuration before = cfg;

  auto r = d.default_configuration(cfg);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, defaults::DefaultingErr::MergeFailed);
  EXPECT_EQ(r.error().profile_index, 1u);
  EXPECT_EQ(r.error().merge.detail, "Forbidden is not allowed");
  EXPECT_NE(r.error().message().find("profile 1"), std::string::npos);
  EXPECT_EQ(cfg, before);
  EXPECT_EQ(obs.failed_passes, 1);
  EXPECT_EQ(obs.ok_passes, 0);
}

TEST(Defaulter, DefaultProfile_FailureLeavesProfile) {
  Fixture f;
  defaults::Defaulter d(f.reg, std::make_shared<RejectingMerger>(), plugins::default_plugins());

  api::Profile p;
  p.plugins.emplace();
  p.plugins->multi_point.enabled = {Plugin{"Forbidden", std::nullopt}};
  const api::Profile before = p;

  ASSERT_FALSE(d.default_profile(p).has_value());
  EXPECT_EQ(p, before);
}

// --------------------------- Feature gate ---------------------------------

/**
 * @test Defaulter_VolumeCapacityPriority_ReadAtCallTime
 * @brief The same Defaulter fills the shape only once the gate is flipped.
 */
TEST(Defaulter, VolumeCapacityPriority_ReadAtCallTime) {
  Fixture f;
  defaults::Defaulter d(f.reg);

  api::Configuration off;
  ASSERT_TRUE(d.default_configuration(off).has_value());
  const auto* vb_off = find_typed(off.profiles[0], "VolumeBinding");
  ASSERT_NE(vb_off, nullptr);
  EXPECT_TRUE(vb_off->get<api::VolumeBindingArgs>()->shape.empty());

  ASSERT_TRUE(f.gate->set("VolumeCapacityPriority", true).has_value());
  api::Configuration on;
  ASSERT_TRUE(d.default_configuration(on).has_value());
  const auto* vb_on = find_typed(on.profiles[0], "VolumeBinding");
  ASSERT_NE(vb_on, nullptr);
  const auto& shape = vb_on->get<api::VolumeBindingArgs>()->shape;
  ASSERT_EQ(shape.size(), 2u);
  EXPECT_EQ(shape[0], (api::UtilizationShapePoint{0, 0}));
  EXPECT_EQ(shape[1], (api::UtilizationShapePoint{100, 10}));
}
