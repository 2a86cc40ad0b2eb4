/**
 * @file Raster.cpp
 */
#include "Raster.h"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {
inline int clampi(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
}

Raster::Raster(int width, int height)
    : w(width), h(height) {
    if (width <= 0 || height <= 0) throw std::invalid_argument("Raster: dimensions must be positive");
    px.assign((size_t)width * (size_t)height * 4, 0);
    for (size_t i = 3; i < px.size(); i += 4) px[i] = 255;
}

Raster::Raster(int width, int height, std::vector<std::uint8_t> rgba)
    : w(width), h(height), px(std::move(rgba)) {
    if (width <= 0 || height <= 0) throw std::invalid_argument("Raster: dimensions must be positive");
    if (px.size() != (size_t)width * (size_t)height * 4) throw std::invalid_argument("Raster: buffer size does not match width*height*4");
}

Raster Raster::loadImage(const std::string& path) {
    int width = 0, height = 0, channels = 0;
    // Force 4 channels so every format lands as RGBA8.
    unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 4);
    if (!data) {
        const char* why = stbi_failure_reason();
        throw std::runtime_error("cannot load image " + path + ": " + (why ? why : "unknown error"));
    }
    std::vector<std::uint8_t> rgba(data, data + (size_t)width * (size_t)height * 4);
    stbi_image_free(data);
    return Raster(width, height, std::move(rgba));
}

void Raster::setPixel(int x, int y, std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a) {
    if (x < 0 || y < 0 || x >= w || y >= h) return;
    size_t i = ((size_t)y * (size_t)w + (size_t)x) * 4;
    px[i] = r; px[i + 1] = g; px[i + 2] = b; px[i + 3] = a;
}

Rgb Raster::pixel(int x, int y) const {
    if (empty()) return Rgb{};
    x = clampi(x, 0, w - 1);
    y = clampi(y, 0, h - 1);
    size_t i = ((size_t)y * (size_t)w + (size_t)x) * 4;
    return Rgb{px[i] / 255.0f, px[i + 1] / 255.0f, px[i + 2] / 255.0f};
}

Rgb Raster::sample(float x, float y) const {
    return pixel((int)std::floor(x), (int)std::floor(y));
}

float Raster::luminance(int x, int y) const {
    return brightnessOf(pixel(x, y));
}

Rgb Raster::averageInDisk(float x, float y, float radius, std::mt19937& rng) const {
    if (empty()) return Rgb{};
    int count = std::max(4, std::min(16, (int)std::floor(radius / 2.0f)));
    std::uniform_real_distribution<float> ang(0.0f, 6.2831853f);
    std::uniform_real_distribution<float> frac(0.0f, 0.8f);
    float r = 0.0f, g = 0.0f, b = 0.0f;
    for (int i = 0; i < count; ++i) {
        float a = ang(rng);
        float d = frac(rng) * radius;
        Rgb c = sample(x + std::cos(a) * d, y + std::sin(a) * d);
        r += c.r; g += c.g; b += c.b;
    }
    return liftNearBlack(Rgb{r / count, g / count, b / count});
}
