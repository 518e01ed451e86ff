/**
 * @file test_merge.cpp
 * @brief Tests for DefaultPluginMerger.
 *
 * Validates:
 *  - Absent overrides yield the built-in pipeline
 *  - In-place replacement, append, disable by name and "*"
 *  - Extension points merge independently
 *  - Idempotence on the merger's own output
 */

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "schedcfg/plugins/default_plugins.hpp"
#include "schedcfg/plugins/merge.hpp"

using schedcfg::api::ExtensionPoint;
using schedcfg::api::Plugin;
using schedcfg::api::Plugins;
using schedcfg::api::PluginSet;
using schedcfg::plugins::DefaultPluginMerger;
using schedcfg::plugins::default_plugins;

static std::vector<std::string> names_of(const std::vector<Plugin>& v) {
  std::vector<std::string> out;
  for (const auto& p : v) out.push_back(p.name);
  return out;
}

static Plugins small_defaults() {
  Plugins d;
  d.multi_point.enabled = {Plugin{"A", std::nullopt}, Plugin{"B", 2}, Plugin{"C", std::nullopt}};
  return d;
}

// --------------------------- Built-in set ---------------------------------

TEST(DefaultPlugins, MultiPointOnly_WithWeights) {
  const Plugins d = default_plugins();
  ASSERT_EQ(d.multi_point.enabled.size(), 20u);
  EXPECT_EQ(d.multi_point.enabled.front().name, "PrioritySort");
  EXPECT_EQ(d.multi_point.enabled.back().name, "DefaultBinder");
  EXPECT_EQ(d.multi_point.enabled[3].name, "TaintToleration");
  EXPECT_EQ(d.multi_point.enabled[3].weight, 3);
  for (const auto ep : schedcfg::api::kExtensionPoints) {
    if (ep == ExtensionPoint::MultiPoint) continue;
    EXPECT_TRUE(d.at(ep).enabled.empty());
  }
}

// --------------------------- Merge rules ----------------------------------

TEST(Merge, NoOverrides_ReturnsDefaults) {
  DefaultPluginMerger m;
  auto r = m.merge(small_defaults(), std::nullopt);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.value(), small_defaults());
}

TEST(Merge, EmptyOverrides_ReturnsDefaults) {
  DefaultPluginMerger m;
  auto r = m.merge(small_defaults(), Plugins{});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.value(), small_defaults());
}

/**
 * @test Merge_Reconfigured_ReplacedInPlace
 * @brief A custom entry named like a default takes the default's position.
 */
TEST(Merge, Reconfigured_ReplacedInPlace) {
  Plugins custom;
  custom.multi_point.enabled = {Plugin{"Extra", std::nullopt}, Plugin{"B", 7}};

  auto r = DefaultPluginMerger{}.merge(small_defaults(), custom);
  ASSERT_TRUE(r.has_value());
  const auto& enabled = r->multi_point.enabled;
  EXPECT_EQ(names_of(enabled), (std::vector<std::string>{"A", "B", "C", "Extra"}));
  EXPECT_EQ(enabled[1].weight, 7);
}

TEST(Merge, DisabledByName) {
  Plugins custom;
  custom.multi_point.disabled = {Plugin{"B", 5}};

  auto r = DefaultPluginMerger{}.merge(small_defaults(), custom);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(names_of(r->multi_point.enabled), (std::vector<std::string>{"A", "C"}));
  ASSERT_EQ(r->multi_point.disabled.size(), 1u);
  // Only the name is carried over.
  EXPECT_EQ(r->multi_point.disabled[0], (Plugin{"B", std::nullopt}));
}

/**
 * @test Merge_DisableAll_KeepsOnlyCustom
 * @brief "*" drops every default; explicit custom entries survive.
 */
TEST(Merge, DisableAll_KeepsOnlyCustom) {
  Plugins custom;
  custom.multi_point.disabled = {Plugin{"*", std::nullopt}};
  custom.multi_point.enabled = {Plugin{"C", std::nullopt}, Plugin{"Mine", 1}};

  auto r = DefaultPluginMerger{}.merge(small_defaults(), custom);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(names_of(r->multi_point.enabled), (std::vector<std::string>{"C", "Mine"}));
}

TEST(Merge, DisabledAndEnabled_EnabledKeptAtEnd) {
  Plugins custom;
  custom.multi_point.disabled = {Plugin{"A", std::nullopt}};
  custom.multi_point.enabled = {Plugin{"A", 4}};

  auto r = DefaultPluginMerger{}.merge(small_defaults(), custom);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(names_of(r->multi_point.enabled), (std::vector<std::string>{"B", "C", "A"}));
  EXPECT_EQ(r->multi_point.enabled.back().weight, 4);
}

TEST(Merge, ExtensionPoints_Independent) {
  Plugins custom;
  custom.filter.enabled = {Plugin{"FilterOnly", std::nullopt}};
  custom.score.disabled = {Plugin{"A", std::nullopt}};

  auto r = DefaultPluginMerger{}.merge(small_defaults(), custom);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(names_of(r->multi_point.enabled), (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_EQ(names_of(r->filter.enabled), (std::vector<std::string>{"FilterOnly"}));
  EXPECT_TRUE(r->score.enabled.empty());
  EXPECT_EQ(r->score.disabled.size(), 1u);
}

// --------------------------- Idempotence ----------------------------------

/**
 * @test Merge_Idempotent
 * @brief merge(d, merge(d, x)) == merge(d, x) over the real built-in set.
 */
TEST(Merge, Idempotent) {
  Plugins custom;
  custom.multi_point.enabled = {Plugin{"Coscheduling", std::nullopt}, Plugin{"NodeAffinity", 9}};
  custom.multi_point.disabled = {Plugin{"ImageLocality", std::nullopt}};
  custom.pre_filter.enabled = {Plugin{"Custom", std::nullopt}};

  DefaultPluginMerger m;
  const Plugins d = default_plugins();
  auto once = m.merge(d, custom);
  ASSERT_TRUE(once.has_value());
  auto twice = m.merge(d, once.value());
  ASSERT_TRUE(twice.has_value());
  EXPECT_EQ(twice.value(), once.value());
}
