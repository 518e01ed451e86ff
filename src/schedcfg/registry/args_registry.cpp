// ArgsRegistry: RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: copy current map, mutate, atomic_store (RELEASE).
// The shared_ptr reference count provides the grace period: old snapshots stay
// alive until the last defaulting pass holding one drops it.

#include "schedcfg/registry/args_registry.hpp"
#include "schedcfg/config/constants.hpp"

#include <algorithm>
#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <string_view>

#include <spdlog/spdlog.h>

namespace schedcfg::registry {

//------------------------------- Validation -----------------------------------

bool ArgsRegistry::validate_kind(std::string_view kind) noexcept {
    if (kind.empty()) return false;
    // Kinds are Go-style type names: [A-Za-z0-9]
    for (char c : kind) {
        const bool ok = ((c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

//------------------------------- Lookup ---------------------------------------

std::shared_ptr<const ArgsRegistry::Map>
ArgsRegistry::snapshot() const noexcept {
    // RCU read: acquire pairs with the RELEASE store in publish().
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

bool ArgsRegistry::has_kind(std::string_view kind) const noexcept {
    auto snap = snapshot();
    return snap && (snap->find(kind) != snap->end());
}

std::size_t ArgsRegistry::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::vector<std::string> ArgsRegistry::list_kinds() const {
    std::vector<std::string> out;
    auto snap = snapshot();
    if (!snap) return out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

const KindEntry* ArgsRegistry::find(const Map& snap, const api::TypedArgs& args) const noexcept {
    if (args.payload() == nullptr) return nullptr;
    auto it = snap.find(args.kind());
    return it == snap.end() ? nullptr : &it->second;
}

std::optional<api::TypedArgs> ArgsRegistry::make(std::string_view kind) const {
    lookups_.fetch_add(1, std::memory_order_relaxed);
    auto snap = snapshot();
    auto it = snap->find(kind);
    if (it == snap->end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    return api::TypedArgs{it->second.make()};
}

void ArgsRegistry::apply_defaults(api::TypedArgs& args) const {
    auto snap = snapshot();
    const KindEntry* e = find(*snap, args);
    if (e == nullptr || !e->apply_defaults) return;
    e->apply_defaults(*args.payload());
    defaulted_.fetch_add(1, std::memory_order_relaxed);
}

bool ArgsRegistry::decode(const YAML::Node& node, api::TypedArgs& args) const {
    auto snap = snapshot();
    const KindEntry* e = find(*snap, args);
    if (e == nullptr || !e->decode) return false;
    e->decode(node, *args.payload());
    return true;
}

std::optional<YAML::Node> ArgsRegistry::encode(const api::TypedArgs& args) const {
    auto snap = snapshot();
    const KindEntry* e = find(*snap, args);
    if (e == nullptr || !e->encode) return std::nullopt;
    return e->encode(*args.payload());
}

//------------------------------- Mutations ------------------------------------

void ArgsRegistry::publish(std::shared_ptr<Map> next) noexcept {
    // RCU update: publish new snapshot. RELEASE pairs with reader ACQUIRE so that
    // all prior writes to *next are visible to readers that load it.
    std::shared_ptr<const Map> cnext = std::move(next); // convert Map -> const Map
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

RegistryErr ArgsRegistry::register_kind(std::string_view kind, KindEntry entry) {
    if (!validate_kind(kind) || !entry.make) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return RegistryErr::Invalid;
    }
    // One kind, one type: the factory must produce what the key promises.
    if (auto probe = entry.make(); !probe || probe->kind() != kind) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("args registry: factory for {} produces a different kind", kind);
        return RegistryErr::Invalid;
    }

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (snap->find(kind) != snap->end()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return RegistryErr::Exists;
    }

    auto next = std::make_shared<Map>(*snap); // copy-on-write
    next->emplace(std::string(kind), std::move(entry));
    publish(std::move(next));
    registrations_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("args registry: registered kind {}", kind);
    return RegistryErr::Ok;
}

bool ArgsRegistry::unregister_kind(std::string_view kind) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap || snap->empty()) return false;

    auto next = std::make_shared<Map>(*snap);
    auto it = next->find(kind);
    if (it == next->end()) return false;
    next->erase(it);
    publish(std::move(next));
    return true;
}

ArgsRegistry::Stats ArgsRegistry::stats() const noexcept {
    Stats s;
    s.registrations = registrations_.load(std::memory_order_relaxed);
    s.lookups       = lookups_.load(std::memory_order_relaxed);
    s.misses        = misses_.load(std::memory_order_relaxed);
    s.defaulted     = defaulted_.load(std::memory_order_relaxed);
    s.failures      = failures_.load(std::memory_order_relaxed);
    return s;
}

std::string args_kind_for(std::string_view plugin_name) {
    std::string kind(plugin_name);
    kind += config::constants::ARGS_KIND_SUFFIX;
    return kind;
}

std::string_view to_string(RegistryErr e) noexcept {
    switch (e) {
        case RegistryErr::Ok:      return "ok";
        case RegistryErr::Exists:  return "kind already registered";
        case RegistryErr::Invalid: return "invalid kind entry";
    }
    return "unknown error";
}

} // namespace schedcfg::registry
