/**
 * @file SimulationContext.h
 * @brief Clock, counters and check timestamps owned by the orchestrator and threaded through the frame.
 */
#pragma once

#include <cstdint>

struct SimulationContext {
    double nowMs{0.0};
    std::uint64_t frame{0};
    int totalSpawned{0};            /**< live dynamically spawned circles counted against the spawn cap */
    double lastSpawnCheckMs{0.0};
    double lastColorCheckMs{0.0};
    std::uint64_t nextCircleId{1};
    std::uint64_t generation{0};    /**< number of layouts adopted so far */
};
