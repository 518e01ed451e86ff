#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: parse a KubeSchedulerConfiguration YAML document, dump one back.
 * @details Plugin args whose kind (plugin name + "Args") is registered are
 *          decoded into typed objects; all others are kept as opaque text.
 *          Loading does not apply defaults.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "schedcfg/api/types.hpp"
#include "schedcfg/compat/expected.hpp"
#include "schedcfg/registry/args_registry.hpp"

namespace schedcfg::config {

    /** @enum LoadErr
     *  @brief Reasons a document is rejected.
     */
    enum class LoadErr : std::uint8_t {
        Io,        ///< File cannot be read
        Parse,     ///< Not well-formed YAML
        WrongKind, ///< apiVersion/kind is not a v1 KubeSchedulerConfiguration
        BadField   ///< A field has the wrong shape or an unparsable value
    };

    /** @struct LoadError
     *  @brief Rejection reason plus detail (field path, line/column).
     */
    struct LoadError {
        LoadErr     code{LoadErr::Parse};
        std::string detail;

        /// One-line description for logs.
        std::string message() const;
    };

    /// Kind of the top-level document.
    inline constexpr std::string_view CONFIGURATION_KIND = "KubeSchedulerConfiguration";

    /** @class Loader
     *  @brief Source of scheduler configuration.
     */
    class Loader {
    public:
        /// @param registry Kinds that are decoded into typed args.
        explicit Loader(std::shared_ptr<const registry::ArgsRegistry> registry);

        /**
         * @brief Load configuration from a YAML file.
         * @param path File path.
         * @return Configuration exactly as written (no defaults) or LoadError.
         */
        schedcfg_detail::expected<api::Configuration, LoadError> load_from_file(const std::string& path) const;

        /// Load configuration from YAML text.
        schedcfg_detail::expected<api::Configuration, LoadError> load_from_string(std::string_view text) const;

        /// Serialize a configuration as a YAML document.
        std::string dump(const api::Configuration& cfg) const;

    private:
        std::shared_ptr<const registry::ArgsRegistry> registry_;
    };

    /// Human-readable error label.
    std::string_view to_string(LoadErr e) noexcept;

} // namespace schedcfg::config
