#pragma once

#include <string>

struct ProviderSettings {
    std::string name;
    double success_rate = 1.0; // Probability in [0, 1] that a simulated attempt succeeds

    bool operator==(const ProviderSettings& other) const {
        return name == other.name && success_rate == other.success_rate;
    }
};
