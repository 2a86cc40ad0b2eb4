/**
 * @file ColorChangeTracker.h
 * @brief Per-pixel change intensity: Sobel edge magnitude blended with frame-to-frame RGB delta.
 */
#pragma once

#include "Raster.h"

#include <vector>

/** @brief Row-major intensity grid in [0,1], same size as the raster it was built from. */
struct ColorChangeMap {
    int width{0};
    int height{0};
    std::vector<float> values;
    float mean{0.0f};

    bool empty() const { return values.empty(); }
    /** @brief Intensity at canvas position (x,y), clamped into the map; 0 when empty. */
    float intensityAt(float x, float y) const;
    /** @brief Mean intensity over the whole map; 0 when empty. */
    float average() const { return mean; }
};

class ColorChangeTracker {
public:
    explicit ColorChangeTracker(double minIntervalMs = 100.0);

    /**
     * @brief Rebuild the map from @p raster unless the last rebuild is younger than the interval.
     * @return true when the map was rebuilt.
     *
     * Spatial term: luminance Sobel magnitude normalised by its maximum, with border pixels copying
     * the nearest interior value. When the previous raster has the same size the map becomes
     * 0.7 * spatial + 0.3 * |delta rgb| / sqrt(3).
     */
    bool update(const Raster& raster, double nowMs);
    const ColorChangeMap& map() const { return current; }
    bool hasMap() const { return !current.empty(); }
    void reset();

private:
    void computeSpatial(const Raster& raster, std::vector<float>& out) const;

    double interval;
    double lastUpdateMs{0.0};
    bool updatedOnce{false};
    Raster previous;
    ColorChangeMap current;
};
