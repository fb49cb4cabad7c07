#include "common/version.hpp"
#include "common/utils.hpp"
#include <cctype>
#include <tuple>

std::optional<ApplianceVersion> ApplianceVersion::parse(const std::string& text) {
    std::string value = utils::trim(text);
    if (!value.empty() && (value[0] == 'v' || value[0] == 'V')) {
        value.erase(0, 1);
    }

    int parts[3] = {0, 0, 0};
    size_t index = 0;
    size_t pos = 0;
    bool sawDigit = false;

    while (pos < value.size() && index < 3) {
        char c = value[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (parts[index] > 100000) {
                return std::nullopt;
            }
            parts[index] = parts[index] * 10 + (c - '0');
            sawDigit = true;
            ++pos;
        } else if (c == '.' && sawDigit) {
            ++index;
            sawDigit = false;
            ++pos;
        } else {
            break;
        }
    }

    // Require at least major.minor; anything after the numeric part is a suffix
    if (index == 0 || (index < 3 && !sawDigit)) {
        return std::nullopt;
    }

    ApplianceVersion version;
    version.major = parts[0];
    version.minor = parts[1];
    version.patch = parts[2];
    return version;
}

bool ApplianceVersion::newerFeatureReleaseThan(const ApplianceVersion& other) const {
    return std::tie(major, minor) > std::tie(other.major, other.minor);
}

bool ApplianceVersion::operator<(const ApplianceVersion& other) const {
    return std::tie(major, minor, patch) < std::tie(other.major, other.minor, other.patch);
}
