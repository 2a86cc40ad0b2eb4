#include "TestSupport.h"

#include "PoissonSampler.h"

#include <random>
#include <stdexcept>

int main() {
    {
        std::mt19937 rng(1234);
        PoissonSampler ps(400.0f, 300.0f, 12.0f);
        auto pts = ps.generate(rng);
        REQUIRE(pts.size() > 100, "Poisson set should cover the area: " << pts.size());
        for (size_t i = 0; i < pts.size(); ++i) {
            REQUIRE(pts[i].x >= 0.0f && pts[i].x < 400.0f && pts[i].y >= 0.0f && pts[i].y < 300.0f,
                    "point " << i << " outside the rectangle");
            for (size_t k = i + 1; k < pts.size(); ++k) {
                float dx = pts[i].x - pts[k].x, dy = pts[i].y - pts[k].y;
                REQUIRE(dx * dx + dy * dy >= 12.0f * 12.0f * 0.9999f, "points " << i << "," << k << " too close");
            }
        }
    }
    {
        // Same seed, same set.
        std::mt19937 a(99), b(99);
        PoissonSampler ps(200.0f, 200.0f, 10.0f);
        auto pa = ps.generate(a);
        auto pb = ps.generate(b);
        REQUIRE(pa.size() == pb.size(), "deterministic count");
        for (size_t i = 0; i < pa.size(); ++i)
            REQUIRE(pa[i].x == pb[i].x && pa[i].y == pb[i].y, "deterministic point " << i);
    }
    {
        // A distance larger than the area still yields the single seed point.
        std::mt19937 rng(5);
        PoissonSampler ps(10.0f, 10.0f, 50.0f);
        auto pts = ps.generate(rng);
        REQUIRE(pts.size() == 1, "one point when nothing else fits");
    }
    {
        bool threw = false;
        try { PoissonSampler bad(100.0f, 100.0f, 0.0f); } catch (const std::invalid_argument&) { threw = true; }
        REQUIRE(threw, "zero distance rejected");
        threw = false;
        try { PoissonSampler bad(-1.0f, 100.0f, 5.0f); } catch (const std::invalid_argument&) { threw = true; }
        REQUIRE(threw, "negative width rejected");
    }
    std::cout << "[PASS] test_poisson\n";
    return 0;
}
