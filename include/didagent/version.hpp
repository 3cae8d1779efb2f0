#ifndef DIDAGENT_VERSION_HPP
#define DIDAGENT_VERSION_HPP

#pragma once

namespace didagent {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 3;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.3.0"), shown in the startup banner
    inline constexpr const char* version_string = "0.3.0";

} // namespace didagent

#endif // DIDAGENT_VERSION_HPP
