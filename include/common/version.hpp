#pragma once

#include <optional>
#include <string>

// Appliance release number, e.g. "2.12.3". Suffixes such as "-rc1" are
// ignored when comparing.
struct ApplianceVersion {
    int major{0};
    int minor{0};
    int patch{0};

    static std::optional<ApplianceVersion> parse(const std::string& text);

    // Compares major.minor only.
    bool newerFeatureReleaseThan(const ApplianceVersion& other) const;

    bool operator<(const ApplianceVersion& other) const;
};
