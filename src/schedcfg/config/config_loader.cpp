/**
 * @file config_loader.cpp
 * @brief yaml-cpp backed loader and emitter for KubeSchedulerConfiguration.
 */
#include "schedcfg/config/config_loader.hpp"
#include "schedcfg/config/duration.hpp"
#include "schedcfg/config/yaml_fields.hpp"
#include "schedcfg/version.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace schedcfg::config {
    using namespace schedcfg::api;

    namespace {

    const std::set<std::string> kKnownTopLevel = {
        "apiVersion", "kind", "parallelism", "leaderElection", "clientConnection",
        "percentageOfNodesToScore", "podInitialBackoffSeconds", "podMaxBackoffSeconds",
        "profiles", "enableProfiling", "enableContentionProfiling",
    };

    std::string ep_key(ExtensionPoint ep) { return std::string(to_string(ep)); }

    // ---------- decoding ----------

    std::chrono::milliseconds read_duration(const YAML::Node& n, const char* key, std::chrono::milliseconds cur) {
        if (!yaml::has(n, key)) return cur;
        const auto text = n[key].as<std::string>();
        const auto d = parse_duration(text);
        if (!d) {
            throw YAML::RepresentationException(n[key].Mark(), std::string("invalid duration for ") + key + ": " + text);
        }
        return *d;
    }

    Plugin decode_plugin(const YAML::Node& n) {
        yaml::expect_map(n);
        Plugin p;
        yaml::read(n, "name", p.name);
        yaml::read(n, "weight", p.weight);
        return p;
    }

    PluginSet decode_set(const YAML::Node& n) {
        yaml::expect_map(n);
        PluginSet s;
        yaml::read_list(n, "enabled", s.enabled, decode_plugin);
        yaml::read_list(n, "disabled", s.disabled, decode_plugin);
        return s;
    }

    Plugins decode_plugins(const YAML::Node& n) {
        yaml::expect_map(n);
        Plugins p;
        for (const auto ep : kExtensionPoints) {
            const std::string key = ep_key(ep);
            if (yaml::has(n, key.c_str())) p.at(ep) = decode_set(n[key]);
        }
        return p;
    }

    ArgsObject decode_args(const registry::ArgsRegistry& reg, const std::string& plugin, const YAML::Node& pc) {
        const bool present = yaml::has(pc, "args");
        const YAML::Node args = present ? pc["args"] : YAML::Node{};
        if (present) yaml::expect_map(args);

        const std::string expected_kind = registry::args_kind_for(plugin);
        auto typed = reg.make(expected_kind);
        if (typed) {
            std::string av(schedcfg::api_version);
            if (present) {
                std::string kind = expected_kind;
                yaml::read(args, "apiVersion", av);
                yaml::read(args, "kind", kind);
                if (kind != expected_kind) {
                    throw YAML::RepresentationException(
                        args.Mark(), "args of plugin " + plugin + " must be of kind " + expected_kind + ", got " + kind);
                }
                if (!reg.decode(args, *typed)) {
                    spdlog::debug("kind {} has no decoder; args fields of plugin {} ignored", expected_kind, plugin);
                }
            }
            typed->set_api_version(std::move(av));
            return ArgsObject{std::move(*typed)};
        }

        // Unknown kind: keep the text, validation decides what to do with it.
        OpaqueArgs o;
        if (present) {
            yaml::read(args, "apiVersion", o.api_version);
            yaml::read(args, "kind", o.kind);
            o.raw = YAML::Dump(args);
        }
        return ArgsObject{std::move(o)};
    }

    Profile decode_profile(const registry::ArgsRegistry& reg, const YAML::Node& n) {
        yaml::expect_map(n);
        Profile p;
        yaml::read(n, "schedulerName", p.scheduler_name);
        if (yaml::has(n, "plugins")) p.plugins = decode_plugins(n["plugins"]);
        yaml::read_list(n, "pluginConfig", p.plugin_config, [&reg](const YAML::Node& pc) {
            yaml::expect_map(pc);
            PluginConfig c;
            yaml::read(pc, "name", c.name);
            c.args = decode_args(reg, c.name, pc);
            return c;
        });
        return p;
    }

    Configuration decode_configuration(const registry::ArgsRegistry& reg, const YAML::Node& root) {
        Configuration cfg;
        yaml::read(root, "parallelism", cfg.parallelism);
        yaml::read(root, "percentageOfNodesToScore", cfg.percentage_of_nodes_to_score);
        yaml::read(root, "podInitialBackoffSeconds", cfg.pod_initial_backoff_seconds);
        yaml::read(root, "podMaxBackoffSeconds", cfg.pod_max_backoff_seconds);
        yaml::read(root, "enableProfiling", cfg.enable_profiling);
        yaml::read(root, "enableContentionProfiling", cfg.enable_contention_profiling);

        if (yaml::has(root, "leaderElection")) {
            const YAML::Node le = root["leaderElection"];
            yaml::expect_map(le);
            auto& out = cfg.leader_election;
            yaml::read(le, "leaderElect", out.leader_elect);
            out.lease_duration = read_duration(le, "leaseDuration", out.lease_duration);
            out.renew_deadline = read_duration(le, "renewDeadline", out.renew_deadline);
            out.retry_period   = read_duration(le, "retryPeriod", out.retry_period);
            yaml::read(le, "resourceLock", out.resource_lock);
            yaml::read(le, "resourceName", out.resource_name);
            yaml::read(le, "resourceNamespace", out.resource_namespace);
        }

        if (yaml::has(root, "clientConnection")) {
            const YAML::Node cc = root["clientConnection"];
            yaml::expect_map(cc);
            auto& out = cfg.client_connection;
            yaml::read(cc, "kubeconfig", out.kubeconfig);
            yaml::read(cc, "acceptContentTypes", out.accept_content_types);
            yaml::read(cc, "contentType", out.content_type);
            yaml::read(cc, "qps", out.qps);
            yaml::read(cc, "burst", out.burst);
        }

        yaml::read_list(root, "profiles", cfg.profiles,
                        [&reg](const YAML::Node& p) { return decode_profile(reg, p); });

        for (const auto& kv : root) {
            const auto key = kv.first.as<std::string>();
            if (kKnownTopLevel.count(key) == 0) spdlog::warn("ignoring unknown configuration field {}", key);
        }
        return cfg;
    }

    // ---------- encoding ----------

    YAML::Node encode_plugin(const Plugin& p) {
        YAML::Node n;
        n["name"] = p.name;
        if (p.weight) n["weight"] = *p.weight;
        return n;
    }

    YAML::Node encode_args(const registry::ArgsRegistry& reg, const ArgsObject& args) {
        if (const auto* typed = std::get_if<TypedArgs>(&args)) {
            YAML::Node n(YAML::NodeType::Map);
            n["apiVersion"] = typed->api_version().empty() ? std::string(schedcfg::api_version) : typed->api_version();
            n["kind"] = std::string(typed->kind());
            if (auto fields = reg.encode(*typed)) {
                for (auto it = fields->begin(); it != fields->end(); ++it) n[it->first.as<std::string>()] = it->second;
            }
            return n;
        }
        const auto& opaque = std::get<OpaqueArgs>(args);
        if (opaque.raw.empty()) return YAML::Node{};
        try {
            return YAML::Load(opaque.raw);
        } catch (const YAML::ParserException&) {
            // Not YAML; emit verbatim so nothing is lost.
            return YAML::Node(opaque.raw);
        }
    }

    YAML::Node encode_configuration(const registry::ArgsRegistry& reg, const Configuration& cfg) {
        YAML::Node root;
        root["apiVersion"] = std::string(schedcfg::api_version);
        root["kind"] = std::string(CONFIGURATION_KIND);
        if (cfg.parallelism) root["parallelism"] = *cfg.parallelism;

        const auto& le = cfg.leader_election;
        YAML::Node len(YAML::NodeType::Map);
        if (le.leader_elect) len["leaderElect"] = *le.leader_elect;
        if (le.lease_duration.count() != 0) len["leaseDuration"] = format_duration(le.lease_duration);
        if (le.renew_deadline.count() != 0) len["renewDeadline"] = format_duration(le.renew_deadline);
        if (le.retry_period.count() != 0)   len["retryPeriod"]   = format_duration(le.retry_period);
        if (!le.resource_lock.empty())      len["resourceLock"]      = le.resource_lock;
        if (!le.resource_name.empty())      len["resourceName"]      = le.resource_name;
        if (!le.resource_namespace.empty()) len["resourceNamespace"] = le.resource_namespace;
        if (len.size() != 0) root["leaderElection"] = len;

        const auto& cc = cfg.client_connection;
        YAML::Node ccn(YAML::NodeType::Map);
        if (!cc.kubeconfig.empty())           ccn["kubeconfig"] = cc.kubeconfig;
        if (!cc.accept_content_types.empty()) ccn["acceptContentTypes"] = cc.accept_content_types;
        if (!cc.content_type.empty())         ccn["contentType"] = cc.content_type;
        if (cc.qps != 0.0F)                   ccn["qps"] = cc.qps;
        if (cc.burst != 0)                    ccn["burst"] = cc.burst;
        if (ccn.size() != 0) root["clientConnection"] = ccn;

        if (cfg.percentage_of_nodes_to_score) root["percentageOfNodesToScore"] = *cfg.percentage_of_nodes_to_score;
        if (cfg.pod_initial_backoff_seconds)  root["podInitialBackoffSeconds"] = *cfg.pod_initial_backoff_seconds;
        if (cfg.pod_max_backoff_seconds)      root["podMaxBackoffSeconds"]     = *cfg.pod_max_backoff_seconds;

        for (const auto& prof : cfg.profiles) {
            YAML::Node pn(YAML::NodeType::Map);
            if (prof.scheduler_name) pn["schedulerName"] = *prof.scheduler_name;
            if (prof.plugins) {
                YAML::Node plugins(YAML::NodeType::Map);
                for (const auto ep : kExtensionPoints) {
                    const auto& set = prof.plugins->at(ep);
                    if (set.enabled.empty() && set.disabled.empty()) continue;
                    YAML::Node sn(YAML::NodeType::Map);
                    for (const auto& p : set.enabled)  sn["enabled"].push_back(encode_plugin(p));
                    for (const auto& p : set.disabled) sn["disabled"].push_back(encode_plugin(p));
                    plugins[ep_key(ep)] = sn;
                }
                pn["plugins"] = plugins;
            }
            for (const auto& pc : prof.plugin_config) {
                YAML::Node cn;
                cn["name"] = pc.name;
                YAML::Node args = encode_args(reg, pc.args);
                if (args && !args.IsNull()) cn["args"] = args;
                pn["pluginConfig"].push_back(cn);
            }
            root["profiles"].push_back(pn);
        }

        if (cfg.enable_profiling)            root["enableProfiling"] = *cfg.enable_profiling;
        if (cfg.enable_contention_profiling) root["enableContentionProfiling"] = *cfg.enable_contention_profiling;
        return root;
    }

    } // namespace

    std::string LoadError::message() const {
        return std::string(to_string(code)) + ": " + detail;
    }

    Loader::Loader(std::shared_ptr<const registry::ArgsRegistry> registry) : registry_(std::move(registry)) {}

    schedcfg_detail::expected<Configuration, LoadError> Loader::load_from_file(const std::string& path) const {
        std::ifstream in(path);
        if (!in) {
            return schedcfg_detail::unexpected(LoadError{LoadErr::Io, "cannot open " + path});
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        auto cfg = load_from_string(ss.str());
        if (cfg.has_value()) {
            spdlog::info("loaded configuration from {} ({} profile(s))", path, cfg->profiles.size());
        }
        return cfg;
    }

    schedcfg_detail::expected<Configuration, LoadError> Loader::load_from_string(std::string_view text) const {
        YAML::Node root;
        try {
            root = YAML::Load(std::string(text));
        } catch (const YAML::ParserException& e) {
            return schedcfg_detail::unexpected(LoadError{LoadErr::Parse, e.what()});
        }

        if (!root || root.IsNull()) return Configuration{};
        if (!root.IsMap()) {
            return schedcfg_detail::unexpected(LoadError{LoadErr::Parse, "document is not a mapping"});
        }

        try {
            std::string api_version(schedcfg::api_version);
            std::string kind(CONFIGURATION_KIND);
            yaml::read(root, "apiVersion", api_version);
            yaml::read(root, "kind", kind);
            if (api_version != schedcfg::api_version || kind != CONFIGURATION_KIND) {
                return schedcfg_detail::unexpected(
                    LoadError{LoadErr::WrongKind, api_version + ", Kind=" + kind});
            }
            return decode_configuration(*registry_, root);
        } catch (const YAML::Exception& e) {
            return schedcfg_detail::unexpected(LoadError{LoadErr::BadField, e.what()});
        }
    }

    std::string Loader::dump(const Configuration& cfg) const {
        YAML::Emitter out;
        out << encode_configuration(*registry_, cfg);
        return std::string(out.c_str()) + "\n";
    }

    std::string_view to_string(LoadErr e) noexcept {
        switch (e) {
            case LoadErr::Io:        return "io error";
            case LoadErr::Parse:     return "parse error";
            case LoadErr::WrongKind: return "unsupported apiVersion/kind";
            case LoadErr::BadField:  return "bad field";
        }
        return "unknown error";
    }

} // namespace schedcfg::config
