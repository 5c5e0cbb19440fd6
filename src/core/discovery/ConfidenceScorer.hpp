#pragma once

#include "core/types/DiscoveredDevice.hpp"

namespace rackscan::core {

/**
 * @brief Maps probe evidence to a 0-100 confidence score.
 *
 * Base 30, +20 for a resolved hostname, +30 for at least one open port and
 * a further +10 when more than two ports are open.
 */
class ConfidenceScorer {
public:
    static constexpr int kBaseScore = 30;
    static constexpr int kHostnameBonus = 20;
    static constexpr int kOpenPortBonus = 30;
    static constexpr int kManyPortsBonus = 10;
    static constexpr int kManyPortsThreshold = 2;
    static constexpr int kMaxScore = 100;

    /**
     * @brief Scores a probe draft. Pure and thread-safe.
     * @param draft Probe result to score.
     * @return Score clamped to [0, 100].
     */
    static int score(const DiscoveredDevice& draft);
};

} // namespace rackscan::core
