// What may appear in diagnostics about a host. Secrets never do; account
// names and key paths only in a dev environment that asks for them.
#pragma once

#include "SessionTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace logcollect {

// Lower-cased, trimmed value of an environment variable ("" when unset).
inline std::string envValueLower(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    std::string v = raw ? raw : "";
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = envValueLower(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// LOGCOLLECT_ENV in {dev, development, local, debug}.
inline bool isDevEnvironment() {
    const std::string env = envValueLower("LOGCOLLECT_ENV");
    return env == "dev" || env == "development" || env == "local" || env == "debug";
}

inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("LOGCOLLECT_LOG_SENSITIVE");
}

inline const char *authMethodName(const HostDescriptor &h) {
    if (h.usesKeyAuth())
        return "key";
    return h.password ? "password" : "none";
}

// "web" normally; "web (ops@10.0.0.5:22, key ~/.ssh/id)" when sensitive
// logging is on.
inline std::string hostLogLabel(const HostDescriptor &h) {
    std::string label = h.name.empty() ? h.host : h.name;
    if (!sensitiveLoggingEnabled())
        return label;
    label += " (" + h.username + "@" + h.host + ":" + std::to_string(h.port) + ", " +
             authMethodName(h);
    if (h.private_key_path)
        label += " " + *h.private_key_path;
    return label + ")";
}

} // namespace logcollect
