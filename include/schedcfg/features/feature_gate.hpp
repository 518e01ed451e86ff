#pragma once
/**
 * @file feature_gate.hpp
 * @brief Feature gate oracle consulted by default-fillers at call time.
 */

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "schedcfg/compat/expected.hpp"

namespace schedcfg::features {

/** @enum FeatureErr
 *  @brief Reasons a feature gate override is rejected.
 */
enum class FeatureErr : std::uint8_t {
    UnknownFeature, ///< Name not in the known set
    BadValue,       ///< Value is not "true" or "false"
    Malformed       ///< Item is not of the form Name=value
};

/** @enum Stage
 *  @brief Maturity of a feature.
 */
enum class Stage : std::uint8_t { Alpha, Beta, GA };

/** @struct FeatureSpec
 *  @brief Default state and maturity of a known feature.
 */
struct FeatureSpec {
    bool  default_enabled{false};
    Stage stage{Stage::Alpha};
};

/** @class FeatureGate
 *  @brief Read-only oracle: is a named feature enabled?
 */
class FeatureGate {
public:
    virtual ~FeatureGate() = default;
    /// Unknown names report false.
    virtual bool enabled(std::string_view name) const = 0;
};

/** @class MapFeatureGate
 *  @brief Feature gate backed by a table of known features plus overrides.
 */
class MapFeatureGate final : public FeatureGate {
public:
    using KnownMap = std::map<std::string, FeatureSpec, std::less<>>;

    /// Gate over the features this engine consults.
    MapFeatureGate();
    explicit MapFeatureGate(KnownMap known);

    bool enabled(std::string_view name) const override;

    /// Override one known feature.
    schedcfg_detail::expected<void, FeatureErr> set(std::string_view name, bool value);

    /**
     * @brief Apply a comma-separated override list, e.g. "A=true,B=false".
     * @details All-or-nothing: on error no override from the list is applied.
     */
    schedcfg_detail::expected<void, FeatureErr> set_from_string(std::string_view list);

    /// Names of known features, sorted.
    std::vector<std::string> known_features() const;

private:
    const KnownMap known_;
    mutable std::mutex mu_;
    std::map<std::string, bool, std::less<>> overrides_;
};

/// The features consulted by the built-in default-fillers.
MapFeatureGate::KnownMap default_known_features();

/// Human-readable error label.
std::string_view to_string(FeatureErr e) noexcept;

} // namespace schedcfg::features
