/**
 * @file Raster.h
 * @brief Source image buffer (width x height x RGBA8) sampled for circle colours and change detection.
 */
#pragma once

#include "Circle.h"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

class Raster {
public:
    Raster() = default;
    /** @brief Allocate a black, opaque raster; throws std::invalid_argument on non-positive size. */
    Raster(int width, int height);
    /** @brief Adopt an RGBA buffer; throws std::invalid_argument if its size is not width*height*4. */
    Raster(int width, int height, std::vector<std::uint8_t> rgba);

    /** @brief Decode PNG, JPEG, BMP, TGA, GIF or PNM through stb_image; throws std::runtime_error on failure. */
    static Raster loadImage(const std::string& path);

    int width() const { return w; }
    int height() const { return h; }
    bool empty() const { return w <= 0 || h <= 0; }
    bool sameSize(const Raster& o) const { return w == o.w && h == o.h; }
    Bounds bounds() const { return Bounds{(float)w, (float)h}; }

    const std::vector<std::uint8_t>& data() const { return px; }
    std::vector<std::uint8_t>& data() { return px; }

    void setPixel(int x, int y, std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255);
    /** @brief Colour at integer pixel (x,y), clamped into the image. */
    Rgb pixel(int x, int y) const;
    /** @brief Colour at canvas position (x,y): floor and clamp. */
    Rgb sample(float x, float y) const;
    /** @brief Average of 4..16 random samples within 80% of @p radius around (x,y), near-black lifted. */
    Rgb averageInDisk(float x, float y, float radius, std::mt19937& rng) const;
    /** @brief Rec. 601 luminance in [0,1] at a clamped pixel. */
    float luminance(int x, int y) const;

private:
    int w{0};
    int h{0};
    std::vector<std::uint8_t> px;
};
