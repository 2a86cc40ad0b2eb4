/**
 * @file ColorChangeTracker.cpp
 */
#include "ColorChangeTracker.h"
#include "Logger.h"
#include "Parallel.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float kSqrt3 = 1.7320508075688772f;
inline int clampi(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
}

float ColorChangeMap::intensityAt(float x, float y) const {
    if (values.empty()) return 0.0f;
    int ix = clampi((int)std::floor(x), 0, width - 1);
    int iy = clampi((int)std::floor(y), 0, height - 1);
    return values[(size_t)iy * (size_t)width + (size_t)ix];
}

ColorChangeTracker::ColorChangeTracker(double minIntervalMs)
    : interval(minIntervalMs) {}

void ColorChangeTracker::reset() {
    updatedOnce = false;
    lastUpdateMs = 0.0;
    previous = Raster();
    current = ColorChangeMap();
}

void ColorChangeTracker::computeSpatial(const Raster& raster, std::vector<float>& out) const {
    const int w = raster.width(), h = raster.height();
    out.assign((size_t)w * (size_t)h, 0.0f);
    if (w < 3 || h < 3) return;

    std::vector<float> lum((size_t)w * (size_t)h);
    parallelFor((size_t)h, [&](size_t b, size_t e, int){
        for (size_t y = b; y < e; ++y)
            for (int x = 0; x < w; ++x) lum[y * (size_t)w + (size_t)x] = raster.luminance(x, (int)y);
    });

    std::vector<float> localMax((size_t)workerCount(), 0.0f);
    parallelFor((size_t)(h - 2), [&](size_t b, size_t e, int tid){
        float m = 0.0f;
        for (size_t r = b; r < e; ++r) {
            int y = (int)r + 1;
            for (int x = 1; x < w - 1; ++x) {
                auto L = [&](int xx, int yy){ return lum[(size_t)yy * (size_t)w + (size_t)xx]; };
                float gx = -L(x-1,y-1) - 2*L(x-1,y) - L(x-1,y+1) + L(x+1,y-1) + 2*L(x+1,y) + L(x+1,y+1);
                float gy = -L(x-1,y-1) - 2*L(x,y-1) - L(x+1,y-1) + L(x-1,y+1) + 2*L(x,y+1) + L(x+1,y+1);
                float mag = std::sqrt(gx * gx + gy * gy);
                out[(size_t)y * (size_t)w + (size_t)x] = mag;
                m = std::max(m, mag);
            }
        }
        localMax[(size_t)tid] = std::max(localMax[(size_t)tid], m);
    });
    float maxMag = 0.0f;
    for (float m : localMax) maxMag = std::max(maxMag, m);
    if (maxMag > 0.0f) {
        float inv = 1.0f / maxMag;
        for (auto& v : out) v *= inv;
    }
    // Border pixels copy the nearest interior pixel.
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            if (x > 0 && y > 0 && x < w - 1 && y < h - 1) continue;
            int ix = clampi(x, 1, w - 2), iy = clampi(y, 1, h - 2);
            out[(size_t)y * (size_t)w + (size_t)x] = out[(size_t)iy * (size_t)w + (size_t)ix];
        }
    }
}

bool ColorChangeTracker::update(const Raster& raster, double nowMs) {
    if (raster.empty()) return false;
    if (updatedOnce && nowMs - lastUpdateMs < interval) return false;

    ColorChangeMap next;
    next.width = raster.width();
    next.height = raster.height();
    computeSpatial(raster, next.values);

    if (!previous.empty() && previous.sameSize(raster)) {
        const int w = raster.width();
        parallelFor((size_t)raster.height(), [&](size_t b, size_t e, int){
            for (size_t y = b; y < e; ++y) {
                for (int x = 0; x < w; ++x) {
                    Rgb a = raster.pixel(x, (int)y), p = previous.pixel(x, (int)y);
                    float dr = a.r - p.r, dg = a.g - p.g, db = a.b - p.b;
                    float temporal = std::sqrt(dr * dr + dg * dg + db * db) / kSqrt3;
                    float& v = next.values[y * (size_t)w + (size_t)x];
                    v = std::min(1.0f, 0.7f * v + 0.3f * temporal);
                }
            }
        });
    } else if (!previous.empty()) {
        Logger::debug("color change: raster size changed, temporal term skipped");
    }

    double sum = 0.0;
    for (float v : next.values) sum += v;
    next.mean = next.values.empty() ? 0.0f : (float)(sum / (double)next.values.size());

    current = std::move(next);
    previous = raster;
    lastUpdateMs = nowMs;
    updatedOnce = true;
    return true;
}
