#ifndef SCHEDCFG_VERSION_HPP
#define SCHEDCFG_VERSION_HPP

#pragma once

namespace schedcfg {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 3;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.3.0")
    inline constexpr const char* version_string = "0.3.0";

    /// Configuration API group/version this engine defaults.
    inline constexpr const char* api_version = "kubescheduler.config.k8s.io/v1";

} // namespace schedcfg

#endif // SCHEDCFG_VERSION_HPP
