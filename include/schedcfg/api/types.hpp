/**
 * @file types.hpp
 * @brief Scheduler configuration object graph (KubeSchedulerConfiguration, v1).
 *
 * Constructed by the loader, mutated in place exactly once by the defaulting
 * pass, then handed to validation. Optional scalars use std::optional so that
 * "unset" is distinguishable from an explicit zero. All types are value types
 * with structural equality.
 */
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "schedcfg/api/plugin_args.hpp"

namespace schedcfg::api {

/**
 * @brief A plugin reference inside an extension point.
 * @note `weight` only matters at scoring-capable points (score, multiPoint).
 */
struct Plugin final {
  std::string            name;
  std::optional<int32_t> weight;

  bool operator==(const Plugin&) const = default;
};

/**
 * @brief Enabled/disabled plugin lists for one extension point.
 */
struct PluginSet final {
  std::vector<Plugin> enabled;
  std::vector<Plugin> disabled;

  bool operator==(const PluginSet&) const = default;
};

/**
 * @brief Named stages of the scheduling pipeline.
 */
enum class ExtensionPoint : std::uint8_t {
  MultiPoint,
  PreFilter,
  Filter,
  PostFilter,
  Reserve,
  PreScore,
  Score,
  PreBind,
  Bind,
  PostBind,
  Permit,
  QueueSort
};

/// Every extension point, in declaration order.
inline constexpr std::array<ExtensionPoint, 12> kExtensionPoints{
  ExtensionPoint::MultiPoint, ExtensionPoint::PreFilter, ExtensionPoint::Filter,
  ExtensionPoint::PostFilter, ExtensionPoint::Reserve,   ExtensionPoint::PreScore,
  ExtensionPoint::Score,      ExtensionPoint::PreBind,   ExtensionPoint::Bind,
  ExtensionPoint::PostBind,   ExtensionPoint::Permit,    ExtensionPoint::QueueSort};

/// YAML key of an extension point, e.g. "preFilter".
std::string_view to_string(ExtensionPoint ep) noexcept;

/**
 * @brief Plugin pipeline: one PluginSet per extension point.
 */
struct Plugins final {
  PluginSet multi_point;
  PluginSet pre_filter;
  PluginSet filter;
  PluginSet post_filter;
  PluginSet reserve;
  PluginSet pre_score;
  PluginSet score;
  PluginSet pre_bind;
  PluginSet bind;
  PluginSet post_bind;
  PluginSet permit;
  PluginSet queue_sort;

  PluginSet&       at(ExtensionPoint ep) noexcept;
  const PluginSet& at(ExtensionPoint ep) const noexcept;

  bool operator==(const Plugins&) const = default;
};

/**
 * @brief Arguments for one named plugin.
 */
struct PluginConfig final {
  std::string name;
  ArgsObject  args;

  bool operator==(const PluginConfig&) const = default;
};

/**
 * @brief One scheduling pipeline run by the scheduler process.
 * @note `plugin_config` names are unique within a profile (enforced by validation).
 */
struct Profile final {
  std::optional<std::string> scheduler_name;
  std::optional<Plugins>     plugins;
  std::vector<PluginConfig>  plugin_config;

  bool operator==(const Profile&) const = default;
};

/**
 * @brief Leader election settings. Zero durations mean "unset".
 */
struct LeaderElectionConfiguration final {
  std::optional<bool>       leader_elect;
  std::chrono::milliseconds lease_duration{0};
  std::chrono::milliseconds renew_deadline{0};
  std::chrono::milliseconds retry_period{0};
  std::string               resource_lock;
  std::string               resource_name;
  std::string               resource_namespace;

  bool operator==(const LeaderElectionConfiguration&) const = default;
};

/**
 * @brief API client settings. Zero qps/burst mean "unset".
 */
struct ClientConnectionConfiguration final {
  std::string kubeconfig;
  std::string accept_content_types;
  std::string content_type;
  float       qps{0.0F};
  int32_t     burst{0};

  bool operator==(const ClientConnectionConfiguration&) const = default;
};

/**
 * @brief Top-level scheduler configuration.
 */
struct Configuration final {
  std::optional<int32_t>        parallelism;
  LeaderElectionConfiguration   leader_election;
  ClientConnectionConfiguration client_connection;
  std::optional<int32_t>        percentage_of_nodes_to_score;
  std::optional<int64_t>        pod_initial_backoff_seconds;
  std::optional<int64_t>        pod_max_backoff_seconds;
  std::vector<Profile>          profiles;
  std::optional<bool>           enable_profiling;
  std::optional<bool>           enable_contention_profiling;

  bool operator==(const Configuration&) const = default;
};

} // namespace schedcfg::api
