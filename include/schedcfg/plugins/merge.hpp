#pragma once
/**
 * @file merge.hpp
 * @brief Merge of the built-in plugin pipeline with a profile's overrides.
 * @details The contract every merger honors:
 *          - idempotent: merge(d, merge(d, x)) == merge(d, x);
 *          - extension points are merged independently;
 *          - an explicitly enabled override survives unless explicitly disabled.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "schedcfg/api/types.hpp"
#include "schedcfg/compat/expected.hpp"

namespace schedcfg::plugins {

/** @enum MergeErr
 *  @brief Reasons a merger refuses an override.
 */
enum class MergeErr : std::uint8_t {
    Rejected ///< The override is not acceptable to this merger
};

/** @struct MergeError
 *  @brief Merge failure with a human-readable detail.
 */
struct MergeError {
    MergeErr    code{MergeErr::Rejected};
    std::string detail;
};

/** @class PluginMerger
 *  @brief Collaborator that reconciles default and custom pipelines.
 */
class PluginMerger {
public:
    virtual ~PluginMerger() = default;

    /**
     * @brief Merge `custom` onto `defaults`.
     * @param defaults Built-in pipeline.
     * @param custom Profile pipeline; std::nullopt means "no overrides".
     * @return The merged pipeline or a MergeError that aborts the defaulting pass.
     */
    virtual schedcfg_detail::expected<api::Plugins, MergeError>
    merge(const api::Plugins& defaults, const std::optional<api::Plugins>& custom) const = 0;
};

/** @class DefaultPluginMerger
 *  @brief Per-extension-point merge used by the scheduler.
 *
 * For each extension point:
 *  - custom disabled entries are carried over by name; "*" disables every default;
 *  - defaults not disabled keep their order, replaced in place by a custom
 *    enabled entry of the same name;
 *  - custom enabled entries that replaced nothing are appended in custom order.
 */
class DefaultPluginMerger final : public PluginMerger {
public:
    schedcfg_detail::expected<api::Plugins, MergeError>
    merge(const api::Plugins& defaults, const std::optional<api::Plugins>& custom) const override;

    /// Merge a single extension point.
    static api::PluginSet merge_set(const api::PluginSet& defaults, const api::PluginSet& custom,
                                    api::ExtensionPoint ep);
};

/// Wildcard that disables every default plugin at an extension point.
inline constexpr std::string_view DISABLE_ALL = "*";

} // namespace schedcfg::plugins
