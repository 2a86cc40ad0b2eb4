/**
 * @file PhysicsRelaxer.cpp
 */
#include "PhysicsRelaxer.h"
#include "Logger.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float kFrameDt = 0.016f;
constexpr float kWallBounce = 0.8f;
constexpr float kSettleTolerance = 0.01f;
}

PhysicsRelaxer::PhysicsRelaxer(const PackingConfig& c, unsigned seed)
    : cfg(c), rng(seed) {}

void PhysicsRelaxer::integrate(std::vector<Circle>& circles, float dt) {
    std::uniform_real_distribution<float> j(-0.5f, 0.5f);
    const float g = cfg.gravity * dt * dt;
    for (auto& c : circles) {
        if (c.pinned || c.radius() <= 0.0f) continue;
        float vx = c.x - c.prevX;
        float vy = c.y - c.prevY;
        c.prevX = c.x;
        c.prevY = c.y;
        c.x += vx * cfg.damping + j(rng) * jitter;
        c.y += vy * cfg.damping + g + j(rng) * jitter;
    }
}

float PhysicsRelaxer::resolveCollisions(std::vector<Circle>& circles) const {
    float worst = 0.0f;
    const size_t n = circles.size();
    // Pairwise O(n^2); fine for a few hundred circles.
    for (size_t i = 0; i < n; ++i) {
        Circle& a = circles[i];
        if (a.radius() <= 0.0f) continue;
        for (size_t k = i + 1; k < n; ++k) {
            Circle& b = circles[k];
            if (b.radius() <= 0.0f) continue;
            if (a.pinned && b.pinned) continue;
            float dx = b.x - a.x, dy = b.y - a.y;
            float minDist = (a.radius() + b.radius()) * cfg.circleSpacing;
            float d2 = dx * dx + dy * dy;
            if (d2 >= minDist * minDist) continue;
            float dist = std::sqrt(d2);
            if (dist <= 0.0f) continue; // coincident centres: no normal
            float overlap = minDist - dist;
            worst = std::max(worst, overlap);
            float nx = dx / dist, ny = dy / dist;
            if (a.pinned) { b.x += nx * overlap; b.y += ny * overlap; continue; }
            if (b.pinned) { a.x -= nx * overlap; a.y -= ny * overlap; continue; }
            float total = a.mass() + b.mass();
            float ra = (b.mass() / total) * 1.5f;
            float rb = (a.mass() / total) * 1.5f;
            float sx = nx * overlap * 0.5f, sy = ny * overlap * 0.5f;
            a.x -= sx * ra; a.y -= sy * ra;
            b.x += sx * rb; b.y += sy * rb;
        }
    }
    return worst;
}

void PhysicsRelaxer::constrainToBounds(std::vector<Circle>& circles, const Bounds& bounds) const {
    for (auto& c : circles) {
        float r = c.radius();
        if (r <= 0.0f) continue;
        float minX = r, maxX = std::max(r, bounds.width - r);
        float minY = r, maxY = std::max(r, bounds.height - r);
        if (c.x < minX || c.x > maxX) {
            float v = c.x - c.prevX;
            c.x = std::max(minX, std::min(maxX, c.x));
            bool inward = (c.x == minX && v < 0.0f) || (c.x == maxX && v > 0.0f);
            // Reflect: next velocity = -0.8 * v
            if (inward) c.prevX = c.x + v * kWallBounce;
        }
        if (c.y < minY || c.y > maxY) {
            float v = c.y - c.prevY;
            c.y = std::max(minY, std::min(maxY, c.y));
            bool inward = (c.y == minY && v < 0.0f) || (c.y == maxY && v > 0.0f);
            if (inward) c.prevY = c.y + v * kWallBounce;
        }
    }
}

float PhysicsRelaxer::measurePenetration(const std::vector<Circle>& circles) const {
    float worst = 0.0f;
    for (size_t i = 0; i < circles.size(); ++i) {
        const Circle& a = circles[i];
        if (a.radius() <= 0.0f || a.pinned) continue;
        for (size_t k = i + 1; k < circles.size(); ++k) {
            const Circle& b = circles[k];
            if (b.radius() <= 0.0f || b.pinned) continue;
            float dx = b.x - a.x, dy = b.y - a.y;
            float minDist = (a.radius() + b.radius()) * cfg.circleSpacing;
            float d = std::sqrt(dx * dx + dy * dy);
            if (d < minDist) worst = std::max(worst, minDist - d);
        }
    }
    return worst;
}

int PhysicsRelaxer::settle(std::vector<Circle>& circles, const Bounds& bounds, int maxPasses) const {
    int passes = 0;
    while (passes < maxPasses) {
        float p = resolveCollisions(circles);
        constrainToBounds(circles, bounds);
        ++passes;
        if (p < kSettleTolerance) break;
    }
    // Settling moves positions directly; drop the velocity it would otherwise inject.
    for (auto& c : circles) { c.prevX = c.x; c.prevY = c.y; }
    return passes;
}

RelaxStats PhysicsRelaxer::relaxVerlet(std::vector<Circle>& circles, const Bounds& bounds) {
    RelaxStats st;
    const float dt = kFrameDt / (float)cfg.substeps;
    for (int it = 0; it < cfg.physicsIterations; ++it) {
        for (int s = 0; s < cfg.substeps; ++s) {
            integrate(circles, dt);
            resolveCollisions(circles);
            constrainToBounds(circles, bounds);
            ++st.steps;
        }
    }
    return st;
}

RelaxStats PhysicsRelaxer::relaxForces(std::vector<Circle>& circles, const Bounds& bounds) {
    RelaxStats st;
    const size_t n = circles.size();
    const int iterations = std::min(10, std::max(3, (int)n / 50));
    const float centerY = bounds.height / 2.0f;
    std::vector<float> fx(n), fy(n);
    for (int it = 0; it < iterations; ++it) {
        std::fill(fx.begin(), fx.end(), 0.0f);
        std::fill(fy.begin(), fy.end(), 0.0f);
        for (size_t i = 0; i < n; ++i) {
            const Circle& a = circles[i];
            if (a.pinned || a.radius() <= 0.0f) continue;
            for (size_t k = 0; k < n; ++k) {
                if (k == i) continue;
                const Circle& b = circles[k];
                if (b.radius() <= 0.0f) continue;
                float dx = a.x - b.x, dy = a.y - b.y;
                float dist = std::sqrt(dx * dx + dy * dy);
                float minDist = (a.radius() + b.radius()) * cfg.circleSpacing;
                if (dist >= minDist || dist <= 0.0f) continue;
                float f = (minDist - dist) * 0.1f;
                fx[i] += dx / dist * f;
                fy[i] += dy / dist * f;
            }
            float pad = a.radius() + 2.0f;
            if (a.x < pad) fx[i] += (pad - a.x) * 0.2f;
            if (a.x > bounds.width - pad) fx[i] -= (a.x - (bounds.width - pad)) * 0.2f;
            if (a.y < pad) fy[i] += (pad - a.y) * 0.2f;
            if (a.y > bounds.height - pad) fy[i] -= (a.y - (bounds.height - pad)) * 0.2f;
            // gentle upward bias below the centre line
            if (a.y > centerY && centerY > 0.0f) fy[i] -= (a.y - centerY) / centerY * 0.05f;
        }
        const float damp = 0.5f * (1.0f - (float)it / (float)iterations);
        float maxMove = 0.0f;
        for (size_t i = 0; i < n; ++i) {
            Circle& c = circles[i];
            if (c.pinned || c.radius() <= 0.0f) continue;
            float m = std::sqrt(fx[i] * fx[i] + fy[i] * fy[i]);
            maxMove = std::max(maxMove, m);
            float maxStep = std::min(c.radius() * 0.5f, 5.0f);
            if (m > maxStep && m > 0.0f) { fx[i] = fx[i] / m * maxStep; fy[i] = fy[i] / m * maxStep; }
            float r = c.radius();
            float nx = std::max(r, std::min(bounds.width - r, c.x + fx[i] * damp));
            float ny = std::max(r, std::min(bounds.height - r, c.y + fy[i] * damp));
            c.resetPosition(nx, ny);
        }
        ++st.steps;
        if (maxMove < 0.1f) {
            Logger::debug("force relaxation converged after " + std::to_string(it + 1) + " iterations");
            break;
        }
    }
    return st;
}

RelaxStats PhysicsRelaxer::relax(std::vector<Circle>& circles, const Bounds& bounds) {
    RelaxStats st = cfg.useVerletPhysics ? relaxVerlet(circles, bounds) : relaxForces(circles, bounds);
    st.settlePasses = settle(circles, bounds);
    st.maxPenetration = measurePenetration(circles);
    Logger::info(std::string("relaxation (") + (cfg.useVerletPhysics ? "verlet" : "forces") + "): steps="
                 + std::to_string(st.steps) + " settle=" + std::to_string(st.settlePasses)
                 + " penetration=" + std::to_string(st.maxPenetration));
    return st;
}

void PhysicsRelaxer::frameStep(std::vector<Circle>& circles, const Bounds& bounds) {
    const float dt = kFrameDt / (float)std::max(1, cfg.substeps);
    for (int s = 0; s < cfg.substeps; ++s) {
        integrate(circles, dt);
        resolveCollisions(circles);
        constrainToBounds(circles, bounds);
    }
}
