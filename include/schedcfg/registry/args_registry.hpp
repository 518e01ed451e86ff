#pragma once
// schedcfg: ArgsRegistry
// Maps a plugin argument kind ("VolumeBindingArgs") to the capabilities needed
// to build, default, decode and encode it.
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: every defaulting pass only reads; readers take a
//     snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Registrations (in-tree at startup, out-of-tree before the first pass)
//     copy the whole map and atomically swap with RELEASE semantics.
//   • Readers never block writers; writers never block readers.
//   • Writers are serialized by a mutex so concurrent registrations never
//     publish over each other.
// Runtime policy: no exceptions from registry calls; mutations return RegistryErr.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "schedcfg/api/plugin_args.hpp"

namespace schedcfg::registry {

// -----------------------------------------------------------------------------
// Error codes returned by registry mutations.
// -----------------------------------------------------------------------------
/// Result codes for registry mutations.
enum class RegistryErr {
    Ok,         ///< Operation succeeded.
    Exists,     ///< Kind is already registered.
    Invalid     ///< Bad kind name, missing factory, or factory/kind mismatch.
};

/// Builds a zero-value payload.
using ArgsFactory   = std::function<std::unique_ptr<api::PluginArgs>()>;
/// Fills unset fields of a payload in place.
using ArgsDefaulter = std::function<void(api::PluginArgs&)>;
/// Reads a YAML mapping into a zero-value payload. May throw YAML::Exception.
using ArgsDecoder   = std::function<void(const YAML::Node&, api::PluginArgs&)>;
/// Writes a payload as a YAML mapping.
using ArgsEncoder   = std::function<YAML::Node(const api::PluginArgs&)>;

/// Capabilities registered for one kind. Only `make` is mandatory.
struct KindEntry {
    ArgsFactory   make;
    ArgsDefaulter apply_defaults;
    ArgsDecoder   decode;
    ArgsEncoder   encode;
};

// -----------------------------------------------------------------------------
// ArgsRegistry class
// -----------------------------------------------------------------------------
///
/// Maintains a mapping: kind → KindEntry.
/// - Read-mostly: snapshot-swap (RCU-like); lookups are lock-free.
/// - Writes: copy-on-write full map, atomic swap, version increment.
/// - A kind names exactly one C++ type: register_kind() checks that the
///   factory produces a payload reporting the same kind.
//
class ArgsRegistry final {
public:
    // Transparent hash/equal functors enable heterogeneous lookup with string_view.
    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct KeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    using Map = std::unordered_map<std::string, KindEntry, KeyHash, KeyEq>;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of the whole registry.
    std::shared_ptr<const Map> snapshot() const noexcept;

    // --------------------------- Lookup --------------------------------------
    [[nodiscard]] bool has_kind(std::string_view kind) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    /// Sorted kind names.
    [[nodiscard]] std::vector<std::string> list_kinds() const;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    /**
     * @brief Construct a zero-value instance of `kind`.
     * @return std::nullopt when the kind is unknown (not an error: the plugin
     *         takes no arguments or lives outside this build).
     */
    [[nodiscard]] std::optional<api::TypedArgs> make(std::string_view kind) const;

    /// Apply the kind's default-filler in place. No-op for kinds without one.
    void apply_defaults(api::TypedArgs& args) const;

    /// Decode `node` into `args`. False when the kind has no decoder.
    bool decode(const YAML::Node& node, api::TypedArgs& args) const;

    /// Encode `args`. std::nullopt when the kind has no encoder.
    [[nodiscard]] std::optional<YAML::Node> encode(const api::TypedArgs& args) const;

    // --------------------------- Mutations -----------------------------------
    /// Register a new kind. Fails if the kind exists or the entry is invalid.
    RegistryErr register_kind(std::string_view kind, KindEntry entry);

    /**
     * @brief Register a concrete structure `T` under `T::kKind`.
     * @details The wrappers downcast with static_cast: the registry only hands
     *          them payloads whose kind() equals the key they were stored under.
     */
    template <class T>
    RegistryErr register_type(std::function<void(T&)> defaulter = {},
                              std::function<void(const YAML::Node&, T&)> decoder = {},
                              std::function<YAML::Node(const T&)> encoder = {});

    /// Remove a kind. Returns true if it was registered.
    bool unregister_kind(std::string_view kind);

    // --------------------------- Observability -------------------------------
    /// Cumulative counters since construction.
    struct Stats {
        uint64_t registrations{0}, lookups{0}, misses{0}, defaulted{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};
    std::mutex write_mu_; ///< Serializes writers; readers never take it.

    mutable std::atomic<uint64_t> registrations_{0}, lookups_{0}, misses_{0}, defaulted_{0}, failures_{0};

    static bool validate_kind(std::string_view kind) noexcept;
    void publish(std::shared_ptr<Map> next) noexcept;
    /// Entry for a payload's kind, or nullptr.
    const KindEntry* find(const Map& snap, const api::TypedArgs& args) const noexcept;
};

template <class T>
RegistryErr ArgsRegistry::register_type(std::function<void(T&)> defaulter,
                                        std::function<void(const YAML::Node&, T&)> decoder,
                                        std::function<YAML::Node(const T&)> encoder) {
    KindEntry e;
    e.make = [] { return std::unique_ptr<api::PluginArgs>(std::make_unique<T>()); };
    if (defaulter) {
        e.apply_defaults = [fn = std::move(defaulter)](api::PluginArgs& a) { fn(static_cast<T&>(a)); };
    }
    if (decoder) {
        e.decode = [fn = std::move(decoder)](const YAML::Node& n, api::PluginArgs& a) {
            fn(n, static_cast<T&>(a));
        };
    }
    if (encoder) {
        e.encode = [fn = std::move(encoder)](const api::PluginArgs& a) { return fn(static_cast<const T&>(a)); };
    }
    return register_kind(T::kKind, std::move(e));
}

/// Argument kind of a plugin: name + "Args".
std::string args_kind_for(std::string_view plugin_name);

/// Human-readable error label.
std::string_view to_string(RegistryErr e) noexcept;

} // namespace schedcfg::registry
