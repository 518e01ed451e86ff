#pragma once
/**
 * @file defaulter.hpp
 * @brief Profile and top-level configuration defaulting.
 * @details One Defaulter can serve concurrent passes over distinct
 *          configurations: it only reads its registry, merger and table.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "schedcfg/api/types.hpp"
#include "schedcfg/compat/expected.hpp"
#include "schedcfg/config/constants.hpp"
#include "schedcfg/obs/observability.hpp"
#include "schedcfg/plugins/merge.hpp"
#include "schedcfg/registry/args_registry.hpp"

namespace schedcfg::defaults {

/** @enum DefaultingErr
 *  @brief Reasons a defaulting pass aborts.
 */
enum class DefaultingErr : std::uint8_t {
    MergeFailed ///< The plugin merger rejected a profile's overrides
};

/** @struct DefaultingError
 *  @brief Abort reason, with the failing profile and the merger's own error.
 */
struct DefaultingError {
    DefaultingErr       code{DefaultingErr::MergeFailed};
    std::size_t         profile_index{0};
    plugins::MergeError merge;

    /// One-line description for logs.
    std::string message() const;
};

/** @class Defaulter
 *  @brief Fills a partially specified configuration in place.
 */
class Defaulter {
public:
    /**
     * @param registry Argument kinds; read-only during passes.
     * @param merger Built-in/override pipeline merger.
     * @param builtin Pipeline each profile is merged onto.
     * @param table Scalar defaults.
     * @param observer Optional event sink (not owned).
     */
    Defaulter(std::shared_ptr<const registry::ArgsRegistry> registry,
              std::shared_ptr<const plugins::PluginMerger> merger,
              api::Plugins builtin,
              const config::DefaultTable& table = config::kDefaultTable,
              obs::Observer* observer = nullptr);

    /// Defaulter over the built-in pipeline and DefaultPluginMerger.
    explicit Defaulter(std::shared_ptr<const registry::ArgsRegistry> registry,
                       obs::Observer* observer = nullptr);

    /**
     * @brief Merge the built-in pipeline into the profile, then complete its
     *        plugin args.
     * @return DefaultingError when the merger fails; the profile is untouched then.
     */
    schedcfg_detail::expected<void, DefaultingError> default_profile(api::Profile& profile) const;

    /**
     * @brief Default the whole configuration.
     *
     * Parallelism; at least one profile; the default scheduler name for a
     * single unnamed profile; every profile; remaining scalar defaults.
     * All-or-nothing: on error `cfg` is left as it was. Idempotent.
     */
    schedcfg_detail::expected<void, DefaultingError> default_configuration(api::Configuration& cfg) const;

    const config::DefaultTable& table() const noexcept { return table_; }

private:
    schedcfg_detail::expected<void, DefaultingError>
    default_profile_at(api::Profile& profile, std::size_t index) const;

private:
    std::shared_ptr<const registry::ArgsRegistry> registry_;
    std::shared_ptr<const plugins::PluginMerger>  merger_;
    api::Plugins                                  builtin_;
    config::DefaultTable                          table_;
    obs::Observer*                                observer_{nullptr};
};

/// Human-readable error label.
std::string_view to_string(DefaultingErr e) noexcept;

} // namespace schedcfg::defaults
