/**
 * @file PoissonSampler.cpp
 */
#include "PoissonSampler.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

PoissonSampler::PoissonSampler(float width, float height, float minDistance, int maxAttempts)
    : w(width), h(height), dist(minDistance), attempts(std::max(1, maxAttempts)) {
    if (!(width > 0.0f) || !(height > 0.0f)) throw std::invalid_argument("PoissonSampler: area must be positive");
    if (!(minDistance > 0.0f)) throw std::invalid_argument("PoissonSampler: minDistance must be positive");
}

std::vector<SamplePoint> PoissonSampler::generate(std::mt19937& rng) const {
    const float cell = dist / std::sqrt(2.0f);
    const int gw = std::max(1, (int)std::ceil(w / cell));
    const int gh = std::max(1, (int)std::ceil(h / cell));
    std::vector<int> grid((size_t)gw * (size_t)gh, -1);
    std::vector<SamplePoint> points;
    std::vector<int> active;

    auto cellOf = [&](float x, float y, int& cx, int& cy) {
        cx = std::max(0, std::min(gw - 1, (int)(x / cell)));
        cy = std::max(0, std::min(gh - 1, (int)(y / cell)));
    };
    auto valid = [&](float x, float y) {
        if (x < 0.0f || y < 0.0f || x >= w || y >= h) return false;
        int cx, cy;
        cellOf(x, y, cx, cy);
        for (int yy = std::max(0, cy - 2); yy <= std::min(gh - 1, cy + 2); ++yy) {
            for (int xx = std::max(0, cx - 2); xx <= std::min(gw - 1, cx + 2); ++xx) {
                int idx = grid[(size_t)(yy * gw + xx)];
                if (idx < 0) continue;
                float dx = points[(size_t)idx].x - x, dy = points[(size_t)idx].y - y;
                if (dx * dx + dy * dy < dist * dist) return false;
            }
        }
        return true;
    };
    auto add = [&](float x, float y) {
        int cx, cy;
        cellOf(x, y, cx, cy);
        int idx = (int)points.size();
        points.push_back(SamplePoint{x, y});
        grid[(size_t)(cy * gw + cx)] = idx;
        active.push_back(idx);
    };

    std::uniform_real_distribution<float> ux(0.0f, w), uy(0.0f, h);
    int seeds = std::min(5, std::max(1, (int)std::floor(w * h / 50000.0f)));
    for (int s = 0; s < seeds; ++s) {
        float x = ux(rng), y = uy(rng);
        if (valid(x, y)) add(x, y);
    }

    std::uniform_real_distribution<float> ang(0.0f, 6.2831853f);
    std::uniform_real_distribution<float> rad(dist, 2.0f * dist);
    while (!active.empty()) {
        std::uniform_int_distribution<size_t> pick(0, active.size() - 1);
        size_t slot = pick(rng);
        const SamplePoint base = points[(size_t)active[slot]];
        bool found = false;
        for (int k = 0; k < attempts; ++k) {
            float a = ang(rng), r = rad(rng);
            float x = base.x + std::cos(a) * r;
            float y = base.y + std::sin(a) * r;
            if (valid(x, y)) { add(x, y); found = true; break; }
        }
        if (!found) {
            active[slot] = active.back();
            active.pop_back();
        }
    }
    return points;
}
