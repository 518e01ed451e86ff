#pragma once
/**
 * @file yaml_fields.hpp
 * @brief Small yaml-cpp helpers shared by the loader and the argument codecs.
 * @details Absent or null keys leave the target untouched. Present keys of the
 *          wrong shape throw YAML::Exception; the loader converts those into
 *          LoadErr::BadField at its boundary.
 */

#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace schedcfg::config::yaml {

/// True when `node[key]` exists and is not null.
inline bool has(const YAML::Node& node, const char* key) {
    if (!node.IsMap()) return false;
    const YAML::Node v = node[key];
    return v && !v.IsNull();
}

/// Read `node[key]` into `out` when present.
template <class T>
void read(const YAML::Node& node, const char* key, T& out) {
    if (has(node, key)) out = node[key].as<T>();
}

/// Read `node[key]` into an optional when present.
template <class T>
void read(const YAML::Node& node, const char* key, std::optional<T>& out) {
    if (has(node, key)) out = node[key].as<T>();
}

/// Read a sequence under `key`, converting each element with `fn`.
template <class T, class Fn>
void read_list(const YAML::Node& node, const char* key, std::vector<T>& out, Fn fn) {
    if (!has(node, key)) return;
    const YAML::Node seq = node[key];
    if (!seq.IsSequence()) {
        throw YAML::TypedBadConversion<std::vector<T>>(seq.Mark());
    }
    out.clear();
    out.reserve(seq.size());
    for (const auto& item : seq) out.push_back(fn(item));
}

/// Require a mapping (or absent/null) at `node`.
inline void expect_map(const YAML::Node& node) {
    if (node && !node.IsNull() && !node.IsMap()) {
        throw YAML::RepresentationException(node.Mark(), "expected a mapping");
    }
}

} // namespace schedcfg::config::yaml
