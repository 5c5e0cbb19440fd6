#include "core/discovery/ConfidenceScorer.hpp"

#include <algorithm>

namespace rackscan::core {

int ConfidenceScorer::score(const DiscoveredDevice& draft) {
    int result = kBaseScore;

    if (!draft.hostname.empty()) {
        result += kHostnameBonus;
    }
    if (!draft.openPorts.empty()) {
        result += kOpenPortBonus;
        if (static_cast<int>(draft.openPorts.size()) > kManyPortsThreshold) {
            result += kManyPortsBonus;
        }
    }

    return std::clamp(result, 0, kMaxScore);
}

} // namespace rackscan::core
