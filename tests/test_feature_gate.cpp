/**
 * @file test_feature_gate.cpp
 * @brief Tests for MapFeatureGate.
 */
#include <gtest/gtest.h>

#include "schedcfg/features/feature_gate.hpp"

using schedcfg::features::FeatureErr;
using schedcfg::features::FeatureSpec;
using schedcfg::features::MapFeatureGate;
using schedcfg::features::Stage;

TEST(FeatureGate, Defaults) {
  MapFeatureGate gate;
  EXPECT_FALSE(gate.enabled("VolumeCapacityPriority"));
  EXPECT_FALSE(gate.enabled("NoSuchFeature"));
  EXPECT_EQ(gate.known_features(), (std::vector<std::string>{"VolumeCapacityPriority"}));
}

TEST(FeatureGate, Set_KnownAndUnknown) {
  MapFeatureGate gate;
  ASSERT_TRUE(gate.set("VolumeCapacityPriority", true).has_value());
  EXPECT_TRUE(gate.enabled("VolumeCapacityPriority"));

  auto r = gate.set("NoSuchFeature", true);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), FeatureErr::UnknownFeature);
}

TEST(FeatureGate, SetFromString) {
  MapFeatureGate gate({{"A", FeatureSpec{false, Stage::Alpha}}, {"B", FeatureSpec{true, Stage::Beta}}});
  ASSERT_TRUE(gate.set_from_string(" A=true , B=false,").has_value());
  EXPECT_TRUE(gate.enabled("A"));
  EXPECT_FALSE(gate.enabled("B"));
  EXPECT_TRUE(gate.set_from_string("").has_value());
}

/**
 * @test FeatureGate_SetFromString_AllOrNothing
 * @brief A bad item rejects the whole list; earlier items are not applied.
 */
TEST(FeatureGate, SetFromString_AllOrNothing) {
  MapFeatureGate gate({{"A", FeatureSpec{false, Stage::Alpha}}});

  auto bad_value = gate.set_from_string("A=true,A=maybe");
  ASSERT_FALSE(bad_value.has_value());
  EXPECT_EQ(bad_value.error(), FeatureErr::BadValue);
  EXPECT_FALSE(gate.enabled("A"));

  auto malformed = gate.set_from_string("A");
  ASSERT_FALSE(malformed.has_value());
  EXPECT_EQ(malformed.error(), FeatureErr::Malformed);

  auto unknown = gate.set_from_string("A=true,Z=true");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error(), FeatureErr::UnknownFeature);
  EXPECT_FALSE(gate.enabled("A"));
}
