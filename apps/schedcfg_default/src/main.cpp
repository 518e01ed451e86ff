// apps/schedcfg_default/src/main.cpp
// schedcfg: schedcfg_default
// Purpose: print the fully-defaulted form of a scheduler configuration file.
//
// Usage:
//   ./schedcfg_default <config.yaml> [--feature-gates=Name=true,...] [--v=debug|info|warn]
//
// Notes:
// - The defaulted document goes to stdout, logs go to stderr.
// - Exit codes: 0 ok, 1 load error, 2 defaulting error, 64 usage error.

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "schedcfg/config/config_loader.hpp"
#include "schedcfg/defaults/defaulter.hpp"
#include "schedcfg/features/feature_gate.hpp"
#include "schedcfg/obs/observability.hpp"
#include "schedcfg/registry/builtin_kinds.hpp"
#include "schedcfg/version.hpp"

namespace {

constexpr int EXIT_LOAD      = 1;
constexpr int EXIT_DEFAULTS  = 2;
constexpr int EXIT_USAGE     = 64;

int usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " <config.yaml> [--feature-gates=Name=true,...] [--v=debug|info|warn]\n";
    return EXIT_USAGE;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("schedcfg"));
    spdlog::set_level(spdlog::level::warn);

    std::string path;
    std::string gates;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (starts_with(arg, "--feature-gates=")) {
            gates = std::string(arg.substr(16));
        } else if (starts_with(arg, "--v=")) {
            const auto level = spdlog::level::from_str(std::string(arg.substr(4)));
            if (level == spdlog::level::off && arg.substr(4) != "off") return usage(argv[0]);
            spdlog::set_level(level);
        } else if (arg == "--version") {
            std::cout << "schedcfg_default " << schedcfg::version_string << " (" << schedcfg::api_version << ")\n";
            return 0;
        } else if (!starts_with(arg, "--") && path.empty()) {
            path = std::string(arg);
        } else {
            return usage(argv[0]);
        }
    }
    if (path.empty()) return usage(argv[0]);

    auto gate = std::make_shared<schedcfg::features::MapFeatureGate>();
    if (auto r = gate->set_from_string(gates); !r.has_value()) {
        spdlog::error("--feature-gates: {}", schedcfg::features::to_string(r.error()));
        return EXIT_USAGE;
    }

    auto registry = std::make_shared<schedcfg::registry::ArgsRegistry>();
    if (auto e = schedcfg::registry::register_builtin_kinds(*registry, gate); e != schedcfg::registry::RegistryErr::Ok) {
        spdlog::critical("registering plugin argument kinds: {}", schedcfg::registry::to_string(e));
        return EXIT_DEFAULTS;
    }

    const schedcfg::config::Loader loader(registry);
    auto cfg = loader.load_from_file(path);
    if (!cfg.has_value()) {
        spdlog::error("{}: {}", path, cfg.error().message());
        return EXIT_LOAD;
    }

    auto* observer = schedcfg::obs::make_log_observer();
    const schedcfg::defaults::Defaulter defaulter(registry, observer);
    if (auto r = defaulter.default_configuration(*cfg); !r.has_value()) {
        spdlog::error("{}: {}", path, r.error().message());
        return EXIT_DEFAULTS;
    }

    const auto c = observer->snapshot();
    spdlog::info("defaulted {} profile(s): {} args defaulted, {} appended, {} opaque",
                 c.profiles, c.args_defaulted, c.args_appended, c.opaque_skipped);

    std::cout << loader.dump(*cfg);
    return 0;
}
