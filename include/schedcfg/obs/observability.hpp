#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: defaulting events + counters.
 * @details The default sink writes structured lines through spdlog.
 */

#include <cstdint>
#include <string>

namespace schedcfg::obs {

    /** @enum Action
     *  @brief What the defaulting pass did with one plugin's arguments.
     */
    enum class Action : std::uint8_t {
        ArgsDefaulted, ///< Existing typed args were default-filled in place
        ArgsAppended,  ///< A defaulted args entry was appended
        OpaqueSkipped, ///< Existing args are opaque; left untouched
        NoArgsKind     ///< No registered kind for the plugin; nothing appended
    };

    /** @struct Counters
     *  @brief Process-level counters for defaulting passes.
     */
    struct Counters {
        uint64_t configurations{0};  ///< Completed top-level passes
        uint64_t profiles{0};        ///< Profiles defaulted
        uint64_t args_defaulted{0};  ///< Existing typed args defaulted
        uint64_t args_appended{0};   ///< Args entries appended
        uint64_t opaque_skipped{0};  ///< Opaque args left untouched
        uint64_t no_args_kind{0};    ///< Plugins without a registered kind
        uint64_t failures{0};        ///< Passes aborted by an error
    };

    /** @struct DefaultingEvent
     *  @brief Payload describing one plugin-args decision.
     */
    struct DefaultingEvent {
        std::string profile;  ///< Scheduler name, or "#<index>" when unnamed
        std::string plugin;   ///< Plugin name
        std::string kind;     ///< Args kind (may be empty for opaque/no kind)
        Action      action{Action::ArgsDefaulted};
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single args decision.
        virtual void record(const DefaultingEvent& e) = 0;
        /// Record the end of a profile pass.
        virtual void profile_done(const std::string& profile) = 0;
        /// Record the end of a top-level pass; `ok` is false when it aborted.
        virtual void configuration_done(bool ok) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide spdlog-backed observer.
    Observer* make_log_observer();

    /// Human-readable action label.
    const char* to_string(Action a) noexcept;

} // namespace schedcfg::obs
