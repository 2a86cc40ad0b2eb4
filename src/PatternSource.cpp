/**
 * @file PatternSource.cpp
 */
#include "PatternSource.h"
#include "Parallel.h"

#include <algorithm>
#include <cmath>

namespace {
inline std::uint8_t toByte(float v) { return (std::uint8_t)std::max(0.0f, std::min(255.0f, v * 255.0f)); }
}

void renderPattern(Raster& out, double tSeconds) {
    const int w = out.width(), h = out.height();
    if (w <= 0 || h <= 0) return;
    const float t = (float)tSeconds;
    const float cx = w * 0.5f, cy = h * 0.5f;
    const float orbit = std::min(w, h) * 0.3f;
    const float ax = cx + std::cos(t * 0.7f) * orbit, ay = cy + std::sin(t * 0.7f) * orbit;
    const float bx = cx + std::cos(t * 0.7f + 3.14159f) * orbit * 0.6f, by = cy + std::sin(t * 0.7f + 3.14159f) * orbit * 0.6f;
    const float ra = std::min(w, h) * 0.12f, rb = std::min(w, h) * 0.08f;
    const float bandY = std::fmod(t * 20.0f, (float)h);
    auto& px = out.data();
    parallelFor((size_t)h, [&](size_t b, size_t e, int){
        for (size_t yy = b; yy < e; ++yy) {
            float y = (float)yy;
            for (int x = 0; x < w; ++x) {
                float u = (float)x / (float)w, v = y / (float)h;
                float r = 0.15f + 0.5f * u, g = 0.1f + 0.4f * v, bl = 0.35f + 0.3f * (1.0f - u);
                float da = (x - ax) * (x - ax) + (y - ay) * (y - ay);
                float db = (x - bx) * (x - bx) + (y - by) * (y - by);
                if (da < ra * ra) { r = 0.95f; g = 0.85f; bl = 0.2f; }
                else if (db < rb * rb) { r = 0.2f; g = 0.9f; bl = 0.9f; }
                if (std::fabs(y - bandY) < 6.0f) { r *= 0.3f; g *= 0.3f; bl *= 0.3f; }
                size_t i = (yy * (size_t)w + (size_t)x) * 4;
                px[i] = toByte(r); px[i + 1] = toByte(g); px[i + 2] = toByte(bl); px[i + 3] = 255;
            }
        }
    });
}
