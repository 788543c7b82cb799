#pragma once

#include <chrono>
#include <string>
#include <vector>

struct ServiceStatus {
    std::vector<std::string> providers; // Priority order
    unsigned int max_attempts = 0;
    std::chrono::milliseconds base_delay{0};
};
