/**
 * @file builtin_kinds.cpp
 * @brief In-tree argument kinds: default-fillers plus YAML codecs.
 */
#include "schedcfg/registry/builtin_kinds.hpp"
#include "schedcfg/config/constants.hpp"
#include "schedcfg/config/yaml_fields.hpp"

#include <string>
#include <utility>
#include <vector>

namespace schedcfg::registry {
    using namespace schedcfg::api;
    using namespace schedcfg::config::constants;
    namespace yaml = schedcfg::config::yaml;

    namespace {

    std::vector<ResourceSpec> default_resource_spec() {
        return {
            {std::string(RESOURCE_CPU),    RESOURCE_SPEC_WEIGHT},
            {std::string(RESOURCE_MEMORY), RESOURCE_SPEC_WEIGHT},
        };
    }

    void default_weights(std::vector<ResourceSpec>& resources) {
        // Unset and explicit 0 are indistinguishable; both get the default.
        for (auto& r : resources) {
            if (r.weight == 0) r.weight = RESOURCE_SPEC_WEIGHT;
        }
    }

    // ---------- shared element codecs ----------

    ResourceSpec decode_resource(const YAML::Node& n) {
        yaml::expect_map(n);
        ResourceSpec r;
        yaml::read(n, "name", r.name);
        yaml::read(n, "weight", r.weight);
        return r;
    }

    YAML::Node encode_resource(const ResourceSpec& r) {
        YAML::Node n;
        n["name"] = r.name;
        n["weight"] = r.weight;
        return n;
    }

    UtilizationShapePoint decode_point(const YAML::Node& n) {
        yaml::expect_map(n);
        UtilizationShapePoint p;
        yaml::read(n, "utilization", p.utilization);
        yaml::read(n, "score", p.score);
        return p;
    }

    YAML::Node encode_point(const UtilizationShapePoint& p) {
        YAML::Node n;
        n["utilization"] = p.utilization;
        n["score"] = p.score;
        return n;
    }

    template <class T, class Fn>
    void write_list(YAML::Node& n, const char* key, const std::vector<T>& items, Fn fn) {
        if (items.empty()) return;
        for (const auto& item : items) n[key].push_back(fn(item));
    }

    // ---------- per-kind codecs ----------

    void decode_preemption(const YAML::Node& n, DefaultPreemptionArgs& a) {
        yaml::read(n, "minCandidateNodesPercentage", a.min_candidate_nodes_percentage);
        yaml::read(n, "minCandidateNodesAbsolute", a.min_candidate_nodes_absolute);
    }

    YAML::Node encode_preemption(const DefaultPreemptionArgs& a) {
        YAML::Node n(YAML::NodeType::Map);
        if (a.min_candidate_nodes_percentage) n["minCandidateNodesPercentage"] = *a.min_candidate_nodes_percentage;
        if (a.min_candidate_nodes_absolute)   n["minCandidateNodesAbsolute"]   = *a.min_candidate_nodes_absolute;
        return n;
    }

    void decode_inter_pod_affinity(const YAML::Node& n, InterPodAffinityArgs& a) {
        yaml::read(n, "hardPodAffinityWeight", a.hard_pod_affinity_weight);
        yaml::read(n, "ignorePreferredTermsOfExistingPods", a.ignore_preferred_terms_of_existing_pods);
    }

    YAML::Node encode_inter_pod_affinity(const InterPodAffinityArgs& a) {
        YAML::Node n(YAML::NodeType::Map);
        if (a.hard_pod_affinity_weight) n["hardPodAffinityWeight"] = *a.hard_pod_affinity_weight;
        if (a.ignore_preferred_terms_of_existing_pods) n["ignorePreferredTermsOfExistingPods"] = true;
        return n;
    }

    void decode_fit(const YAML::Node& n, NodeResourcesFitArgs& a) {
        auto as_string = [](const YAML::Node& v) { return v.as<std::string>(); };
        yaml::read_list(n, "ignoredResources", a.ignored_resources, as_string);
        yaml::read_list(n, "ignoredResourceGroups", a.ignored_resource_groups, as_string);
        if (!yaml::has(n, "scoringStrategy")) return;

        const YAML::Node s = n["scoringStrategy"];
        yaml::expect_map(s);
        ScoringStrategy st;
        yaml::read(s, "type", st.type);
        yaml::read_list(s, "resources", st.resources, decode_resource);
        if (yaml::has(s, "requestedToCapacityRatio")) {
            RequestedToCapacityRatioParam r;
            yaml::read_list(s["requestedToCapacityRatio"], "shape", r.shape, decode_point);
            st.requested_to_capacity_ratio = std::move(r);
        }
        a.scoring_strategy = std::move(st);
    }

    YAML::Node encode_fit(const NodeResourcesFitArgs& a) {
        YAML::Node n(YAML::NodeType::Map);
        auto ident = [](const std::string& s) { return s; };
        write_list(n, "ignoredResources", a.ignored_resources, ident);
        write_list(n, "ignoredResourceGroups", a.ignored_resource_groups, ident);
        if (a.scoring_strategy) {
            YAML::Node s(YAML::NodeType::Map);
            if (!a.scoring_strategy->type.empty()) s["type"] = a.scoring_strategy->type;
            write_list(s, "resources", a.scoring_strategy->resources, encode_resource);
            if (a.scoring_strategy->requested_to_capacity_ratio) {
                YAML::Node r(YAML::NodeType::Map);
                write_list(r, "shape", a.scoring_strategy->requested_to_capacity_ratio->shape, encode_point);
                s["requestedToCapacityRatio"] = r;
            }
            n["scoringStrategy"] = s;
        }
        return n;
    }

    void decode_balanced(const YAML::Node& n, NodeResourcesBalancedAllocationArgs& a) {
        yaml::read_list(n, "resources", a.resources, decode_resource);
    }

    YAML::Node encode_balanced(const NodeResourcesBalancedAllocationArgs& a) {
        YAML::Node n(YAML::NodeType::Map);
        write_list(n, "resources", a.resources, encode_resource);
        return n;
    }

    void decode_spread(const YAML::Node& n, PodTopologySpreadArgs& a) {
        yaml::read_list(n, "defaultConstraints", a.default_constraints, [](const YAML::Node& c) {
            yaml::expect_map(c);
            TopologySpreadConstraint tc;
            yaml::read(c, "maxSkew", tc.max_skew);
            yaml::read(c, "topologyKey", tc.topology_key);
            yaml::read(c, "whenUnsatisfiable", tc.when_unsatisfiable);
            return tc;
        });
        yaml::read(n, "defaultingType", a.defaulting_type);
    }

    YAML::Node encode_spread(const PodTopologySpreadArgs& a) {
        YAML::Node n(YAML::NodeType::Map);
        write_list(n, "defaultConstraints", a.default_constraints, [](const TopologySpreadConstraint& tc) {
            YAML::Node c;
            c["maxSkew"] = tc.max_skew;
            c["topologyKey"] = tc.topology_key;
            c["whenUnsatisfiable"] = tc.when_unsatisfiable;
            return c;
        });
        if (!a.defaulting_type.empty()) n["defaultingType"] = a.defaulting_type;
        return n;
    }

    void decode_volume_binding(const YAML::Node& n, VolumeBindingArgs& a) {
        yaml::read(n, "bindTimeoutSeconds", a.bind_timeout_seconds);
        yaml::read_list(n, "shape", a.shape, decode_point);
    }

    YAML::Node encode_volume_binding(const VolumeBindingArgs& a) {
        YAML::Node n(YAML::NodeType::Map);
        if (a.bind_timeout_seconds) n["bindTimeoutSeconds"] = *a.bind_timeout_seconds;
        write_list(n, "shape", a.shape, encode_point);
        return n;
    }

    void decode_node_affinity(const YAML::Node& n, NodeAffinityArgs& a) {
        if (!yaml::has(n, "addedAffinity")) return;
        const YAML::Node aff = n["addedAffinity"];
        yaml::expect_map(aff);
        if (!yaml::has(aff, "requiredDuringSchedulingIgnoredDuringExecution")) return;
        const YAML::Node req = aff["requiredDuringSchedulingIgnoredDuringExecution"];
        yaml::expect_map(req);
        yaml::read_list(req, "nodeSelectorTerms", a.added_required_terms, [](const YAML::Node& t) {
            yaml::expect_map(t);
            NodeSelectorTerm term;
            yaml::read_list(t, "matchExpressions", term.match_expressions, [](const YAML::Node& e) {
                yaml::expect_map(e);
                NodeSelectorRequirement r;
                yaml::read(e, "key", r.key);
                yaml::read(e, "operator", r.op);
                yaml::read_list(e, "values", r.values, [](const YAML::Node& v) { return v.as<std::string>(); });
                return r;
            });
            return term;
        });
    }

    YAML::Node encode_node_affinity(const NodeAffinityArgs& a) {
        YAML::Node n(YAML::NodeType::Map);
        if (a.added_required_terms.empty()) return n;
        YAML::Node terms;
        for (const auto& term : a.added_required_terms) {
            YAML::Node t(YAML::NodeType::Map);
            write_list(t, "matchExpressions", term.match_expressions, [](const NodeSelectorRequirement& r) {
                YAML::Node e;
                e["key"] = r.key;
                e["operator"] = r.op;
                for (const auto& v : r.values) e["values"].push_back(v);
                return e;
            });
            terms.push_back(t);
        }
        n["addedAffinity"]["requiredDuringSchedulingIgnoredDuringExecution"]["nodeSelectorTerms"] = terms;
        return n;
    }

    } // namespace

    // =====================
    // Default-fillers
    // =====================

    void set_defaults(DefaultPreemptionArgs& args) {
        if (!args.min_candidate_nodes_percentage) {
            args.min_candidate_nodes_percentage = PREEMPTION_MIN_CANDIDATE_NODES_PERCENTAGE;
        }
        if (!args.min_candidate_nodes_absolute) {
            args.min_candidate_nodes_absolute = PREEMPTION_MIN_CANDIDATE_NODES_ABSOLUTE;
        }
    }

    void set_defaults(InterPodAffinityArgs& args) {
        if (!args.hard_pod_affinity_weight) {
            args.hard_pod_affinity_weight = INTER_POD_AFFINITY_HARD_WEIGHT;
        }
    }

    void set_defaults(NodeResourcesFitArgs& args) {
        if (!args.scoring_strategy) {
            args.scoring_strategy = ScoringStrategy{std::string(LEAST_ALLOCATED), default_resource_spec(), std::nullopt};
        }
        if (args.scoring_strategy->resources.empty()) {
            args.scoring_strategy->resources = default_resource_spec();
        }
        default_weights(args.scoring_strategy->resources);
    }

    void set_defaults(NodeResourcesBalancedAllocationArgs& args) {
        if (args.resources.empty()) {
            args.resources = default_resource_spec();
            return;
        }
        default_weights(args.resources);
    }

    void set_defaults(PodTopologySpreadArgs& args) {
        if (args.defaulting_type.empty()) {
            args.defaulting_type = std::string(SYSTEM_DEFAULTING);
        }
    }

    void set_defaults(VolumeBindingArgs& args, const features::FeatureGate& gate) {
        if (!args.bind_timeout_seconds) {
            args.bind_timeout_seconds = VOLUME_BINDING_TIMEOUT_SECONDS;
        }
        if (args.shape.empty() && gate.enabled(FEATURE_VOLUME_CAPACITY_PRIORITY)) {
            args.shape = {
                {0, 0},
                {MAX_UTILIZATION, MAX_CUSTOM_PRIORITY_SCORE},
            };
        }
    }

    // =====================
    // Registration
    // =====================

    RegistryErr register_builtin_kinds(ArgsRegistry& reg,
                                       std::shared_ptr<const features::FeatureGate> gate) {
        if (!gate) return RegistryErr::Invalid;

        // Overload sets need an explicit target type to bind to std::function.
        const RegistryErr results[] = {
            reg.register_type<DefaultPreemptionArgs>(
                [](DefaultPreemptionArgs& a) { set_defaults(a); }, decode_preemption, encode_preemption),
            reg.register_type<InterPodAffinityArgs>(
                [](InterPodAffinityArgs& a) { set_defaults(a); }, decode_inter_pod_affinity, encode_inter_pod_affinity),
            reg.register_type<NodeResourcesFitArgs>(
                [](NodeResourcesFitArgs& a) { set_defaults(a); }, decode_fit, encode_fit),
            reg.register_type<NodeResourcesBalancedAllocationArgs>(
                [](NodeResourcesBalancedAllocationArgs& a) { set_defaults(a); }, decode_balanced, encode_balanced),
            reg.register_type<PodTopologySpreadArgs>(
                [](PodTopologySpreadArgs& a) { set_defaults(a); }, decode_spread, encode_spread),
            reg.register_type<VolumeBindingArgs>(
                [g = std::move(gate)](VolumeBindingArgs& a) { set_defaults(a, *g); },
                decode_volume_binding, encode_volume_binding),
            reg.register_type<NodeAffinityArgs>(
                {}, decode_node_affinity, encode_node_affinity),
        };
        for (const RegistryErr e : results) {
            if (e != RegistryErr::Ok) return e;
        }
        return RegistryErr::Ok;
    }

} // namespace schedcfg::registry
