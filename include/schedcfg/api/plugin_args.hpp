/**
 * @file plugin_args.hpp
 * @brief Polymorphic plugin argument objects: typed (registry-known) or opaque.
 *
 * A PluginConfig entry carries an ArgsObject, a tagged variant of
 *  - OpaqueArgs: the raw text of an argument document whose kind is not known
 *    to this build. It is carried through untouched.
 *  - TypedArgs: an owned PluginArgs payload of a registered kind. Copying a
 *    TypedArgs deep-copies the payload so configurations keep value semantics.
 *
 * The kind string is the type identity of a payload: two payloads reporting
 * the same kind() are the same C++ type. The registry enforces this at
 * registration time.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace schedcfg::api {

/**
 * @brief Abstract base of every typed plugin argument structure.
 */
class PluginArgs {
public:
    virtual ~PluginArgs() = default;

    /// Argument kind, e.g. "VolumeBindingArgs".
    virtual std::string_view kind() const noexcept = 0;

    /// Deep copy.
    virtual std::unique_ptr<PluginArgs> clone() const = 0;

    /// Structural equality against a payload of any kind.
    virtual bool equals(const PluginArgs& other) const noexcept = 0;
};

/**
 * @brief CRTP helper implementing PluginArgs for a concrete structure.
 *
 * `Derived` must expose `static constexpr std::string_view kKind` and a
 * defaulted `operator==`.
 */
template <class Derived>
class PluginArgsBase : public PluginArgs {
public:
    std::string_view kind() const noexcept override { return Derived::kKind; }

    std::unique_ptr<PluginArgs> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }

    bool equals(const PluginArgs& other) const noexcept override {
        if (other.kind() != Derived::kKind) return false;
        return static_cast<const Derived&>(*this) == static_cast<const Derived&>(other);
    }

    /// Base subobject carries no state; lets Derived default its operator==.
    bool operator==(const PluginArgsBase&) const noexcept { return true; }
};

/**
 * @brief Owning, deep-copying holder of a typed argument payload.
 */
class TypedArgs final {
public:
    explicit TypedArgs(std::unique_ptr<PluginArgs> payload, std::string api_version = {}) noexcept
        : payload_(std::move(payload)), api_version_(std::move(api_version)) {}

    TypedArgs(const TypedArgs& other)
        : payload_(other.payload_ ? other.payload_->clone() : nullptr),
          api_version_(other.api_version_) {}

    TypedArgs& operator=(const TypedArgs& other) {
        if (this != &other) {
            payload_ = other.payload_ ? other.payload_->clone() : nullptr;
            api_version_ = other.api_version_;
        }
        return *this;
    }

    TypedArgs(TypedArgs&&) noexcept = default;
    TypedArgs& operator=(TypedArgs&&) noexcept = default;
    ~TypedArgs() = default;

    /// Kind of the payload; empty for a moved-from holder.
    std::string_view kind() const noexcept { return payload_ ? payload_->kind() : std::string_view{}; }

    /// Group/version the payload was tagged with ("" until tagged).
    const std::string& api_version() const noexcept { return api_version_; }
    void set_api_version(std::string v) { api_version_ = std::move(v); }

    PluginArgs*       payload() noexcept { return payload_.get(); }
    const PluginArgs* payload() const noexcept { return payload_.get(); }

    /// Typed access; nullptr when the payload is of another kind.
    template <class T>
    T* get() noexcept {
        return (payload_ && payload_->kind() == T::kKind) ? static_cast<T*>(payload_.get()) : nullptr;
    }

    template <class T>
    const T* get() const noexcept {
        return (payload_ && payload_->kind() == T::kKind) ? static_cast<const T*>(payload_.get()) : nullptr;
    }

    bool operator==(const TypedArgs& other) const noexcept {
        if (api_version_ != other.api_version_) return false;
        if (!payload_ || !other.payload_) return payload_ == other.payload_;
        return payload_->equals(*other.payload_);
    }

private:
    std::unique_ptr<PluginArgs> payload_;
    std::string api_version_;
};

/**
 * @brief Argument document of a kind unknown to this build. Never defaulted.
 */
struct OpaqueArgs final {
    std::string api_version; ///< As found in the document (may be empty)
    std::string kind;        ///< As found in the document (may be empty)
    std::string raw;         ///< Serialized document text

    bool operator==(const OpaqueArgs&) const = default;
};

/// Tagged variant {Opaque | Typed}. A default-constructed entry is an empty opaque blob.
using ArgsObject = std::variant<OpaqueArgs, TypedArgs>;

/// True when defaulting can be applied to `args`.
inline bool is_typed(const ArgsObject& args) noexcept {
    return std::holds_alternative<TypedArgs>(args);
}

/// Build a typed ArgsObject from a concrete structure.
template <class T>
ArgsObject make_typed(T value, std::string api_version = {}) {
    return ArgsObject{TypedArgs{std::make_unique<T>(std::move(value)), std::move(api_version)}};
}

} // namespace schedcfg::api
