#include "TestSupport.h"

#include "Parallel.h"
#include "Raster.h"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace {

void testColourHelpers() {
    REQUIRE_NEAR(colorSimilarity(Rgb{0.2f, 0.4f, 0.6f}, Rgb{0.2f, 0.4f, 0.6f}), 1.0f, 1e-6, "identical colours");
    REQUIRE_NEAR(colorSimilarity(Rgb{0, 0, 0}, Rgb{1, 1, 1}), 0.0f, 1e-6, "black vs white");
    Rgb mid = blendColors(Rgb{0, 0, 0}, Rgb{1, 0.5f, 0}, 0.5f);
    REQUIRE_NEAR(mid.r, 0.5f, 1e-6, "blend r");
    REQUIRE_NEAR(mid.g, 0.25f, 1e-6, "blend g");
    Rgb lifted = liftNearBlack(Rgb{0.0f, 0.0f, 0.0f});
    REQUIRE(brightnessOf(lifted) >= 0.04f, "black is lifted");
    Rgb keep = liftNearBlack(Rgb{0.5f, 0.5f, 0.5f});
    REQUIRE(keep.r == 0.5f && keep.g == 0.5f && keep.b == 0.5f, "bright colours untouched");
}

void testPixelAccess() {
    Raster r(4, 3);
    REQUIRE(r.width() == 4 && r.height() == 3 && !r.empty(), "dimensions");
    REQUIRE(r.data().size() == 48, "rgba buffer");
    r.setPixel(3, 2, 255, 128, 0);
    Rgb p = r.pixel(3, 2);
    REQUIRE_NEAR(p.r, 1.0f, 1e-6, "red channel");
    REQUIRE_NEAR(p.g, 128.0f / 255.0f, 1e-6, "green channel");
    Rgb clamped = r.pixel(100, 100);
    REQUIRE(clamped.r == p.r && clamped.g == p.g, "reads clamp into the image");
    Rgb s = r.sample(3.9f, 2.5f);
    REQUIRE(s.r == p.r, "sample floors the coordinate");
    r.setPixel(-1, 0, 255, 255, 255); // ignored
    REQUIRE(r.pixel(0, 0).r == 0.0f, "out-of-range writes are dropped");

    bool threw = false;
    try { Raster bad(0, 5); } catch (const std::invalid_argument&) { threw = true; }
    REQUIRE(threw, "zero width rejected");
    threw = false;
    try { Raster bad(2, 2, std::vector<std::uint8_t>(10)); } catch (const std::invalid_argument&) { threw = true; }
    REQUIRE(threw, "short buffer rejected");
}

void testDiskAverage() {
    Raster r = solidRaster(100, 100, 0, 255, 0);
    std::mt19937 rng(3);
    Rgb c = r.averageInDisk(50.0f, 50.0f, 20.0f, rng);
    REQUIRE_NEAR(c.g, 1.0f, 1e-6, "uniform image averages to itself");
    Raster dark = solidRaster(50, 50, 0, 0, 0);
    Rgb d = dark.averageInDisk(25.0f, 25.0f, 4.0f, rng);
    REQUIRE(brightnessOf(d) >= 0.04f, "near-black average is lifted");
}

void testImageFile() {
    const std::string path = "test_raster_tmp.ppm";
    {
        std::ofstream out(path, std::ios::binary);
        out << "P6\n2 2\n255\n";
        const unsigned char px[12] = {255, 0, 0, 0, 255, 0, 0, 0, 255, 255, 255, 255};
        out.write(reinterpret_cast<const char*>(px), sizeof(px));
    }
    Raster img = Raster::loadImage(path);
    REQUIRE(img.width() == 2 && img.height() == 2, "decoded dimensions");
    REQUIRE(img.pixel(0, 0).r == 1.0f && img.pixel(1, 0).g == 1.0f && img.pixel(0, 1).b == 1.0f, "pixel order");
    REQUIRE(img.data()[3] == 255, "alpha filled for RGB sources");
    std::remove(path.c_str());

    bool threw = false;
    try { Raster::loadImage("does-not-exist.png"); } catch (const std::runtime_error&) { threw = true; }
    REQUIRE(threw, "missing file reported");

    {
        std::ofstream out(path, std::ios::binary);
        out << "this is not an image";
    }
    threw = false;
    try { Raster::loadImage(path); } catch (const std::runtime_error&) { threw = true; }
    REQUIRE(threw, "undecodable data reported");
    std::remove(path.c_str());
}

void testParallelFor() {
    setWorkerCount(4);
    REQUIRE(workerCount() == 4, "override applies");
    std::vector<int> hits(1000, 0);
    parallelFor(hits.size(), [&](size_t b, size_t e, int){ for (size_t i = b; i < e; ++i) ++hits[i]; });
    for (int h : hits) REQUIRE(h == 1, "every index visited exactly once");

    bool threw = false;
    try {
        parallelFor(100, [](size_t b, size_t, int){ if (b == 0) throw std::runtime_error("boom"); });
    } catch (const std::runtime_error&) { threw = true; }
    REQUIRE(threw, "worker exception propagates");
    setWorkerCount(0);
    REQUIRE(workerCount() >= 1, "default restored");
}

} // namespace

int main() {
    testColourHelpers();
    testPixelAccess();
    testDiskAverage();
    testImageFile();
    testParallelFor();
    std::cout << "[PASS] test_raster\n";
    return 0;
}
