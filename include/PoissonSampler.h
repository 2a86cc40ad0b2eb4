/**
 * @file PoissonSampler.h
 * @brief Bridson Poisson-disk sampling over a rectangle.
 */
#pragma once

#include <cstdint>
#include <random>
#include <vector>

struct SamplePoint {
    float x{0.0f};
    float y{0.0f};
};

class PoissonSampler {
public:
    /** @brief Throws std::invalid_argument for a non-positive area or minimum distance. */
    PoissonSampler(float width, float height, float minDistance, int maxAttempts = 30);

    /**
     * @brief Produce points with pairwise distance >= minDistance.
     *
     * The active list is seeded from min(5, max(1, area/50000)) random points; each active point
     * tries up to maxAttempts candidates in the annulus [d, 2d] and retires once they are exhausted.
     */
    std::vector<SamplePoint> generate(std::mt19937& rng) const;

    float minDistance() const { return dist; }

private:
    float w;
    float h;
    float dist;
    int attempts;
};
