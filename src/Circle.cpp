/**
 * @file Circle.cpp
 * @brief Circle mutation helpers and colour math.
 */
#include "Circle.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kMaxRgbDistance = 1.7320508075688772f; // sqrt(3)
}

float colorSimilarity(const Rgb& a, const Rgb& b) {
    float dr = a.r - b.r, dg = a.g - b.g, db = a.b - b.b;
    float d = std::sqrt(dr * dr + dg * dg + db * db);
    return 1.0f - d / kMaxRgbDistance;
}

Rgb blendColors(const Rgb& a, const Rgb& b, float t) {
    return Rgb{a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t};
}

float brightnessOf(const Rgb& c) {
    return c.r * 0.299f + c.g * 0.587f + c.b * 0.114f;
}

Rgb liftNearBlack(const Rgb& c) {
    float brightness = brightnessOf(c);
    if (brightness >= 0.1f) return c;
    float factor = 0.1f / std::max(brightness, 0.001f);
    return Rgb{std::min(1.0f, c.r * factor + 0.05f),
               std::min(1.0f, c.g * factor + 0.05f),
               std::min(1.0f, c.b * factor + 0.05f)};
}

Circle::Circle(float x_, float y_, float radius_, const Rgb& color_)
    : x(x_), y(y_), prevX(x_), prevY(y_), color(color_) {
    setRadius(radius_);
}

void Circle::setRadius(float r) {
    if (!(r >= 0.0f)) r = 0.0f; // also catches NaN
    rad = r;
    massValue = kPi * r * r;
}

void Circle::translate(float dx, float dy) {
    x += dx; y += dy;
    prevX += dx; prevY += dy;
}

void Circle::resetPosition(float nx, float ny) {
    x = nx; y = ny;
    prevX = nx; prevY = ny;
}
