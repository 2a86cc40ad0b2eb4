/**
 * @file Circle.h
 * @brief Declares the Circle record shared by every stage of the packing pipeline, its colour helpers
 *        and the tagged lifecycle variant.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <variant>

/** @brief Linear RGB colour, each channel in [0,1]. */
struct Rgb {
    float r{0.0f};
    float g{0.0f};
    float b{0.0f};
};

/** @brief Canvas extent used for containment and edge-distance checks. */
struct Bounds {
    float width{0.0f};
    float height{0.0f};
};

/** @brief 1 - euclidean RGB distance / sqrt(3); 1 means identical. */
float colorSimilarity(const Rgb& a, const Rgb& b);
/** @brief Linear blend, @p t = 0 yields @p a and @p t = 1 yields @p b. */
Rgb blendColors(const Rgb& a, const Rgb& b, float t);
/** @brief Perceived brightness (Rec. 601 weights). */
float brightnessOf(const Rgb& c);
/** @brief Boost near-black colours to a 0.1 brightness floor so circles never vanish on a dark background. */
Rgb liftNearBlack(const Rgb& c);

/** @brief Radius at or below which a circle is dead and swept at the end of the frame. */
constexpr float kDeadRadius = 0.01f;

/** @brief Settled circle with no lifecycle work pending ("Stable"). */
struct NoLifecycle {};

/** @brief Progressive ease-out growth from targetRadius*startFraction up to targetRadius. */
struct Growing {
    float targetRadius{0.0f};
    float startRadius{0.0f};
    double startTimeMs{0.0};     /**< staggered start; growth waits until the clock passes it */
    float lastSampledRadius{0.0f};
    bool finalColorSampled{false};
};

/** @brief Step-wise growth of a dynamically spawned circle until it touches a neighbour or reaches the target. */
struct DynamicSpawning {
    float targetRadius{0.0f};
};

enum class AdaptPhase { Resampling, Seeking };

/** @brief Position and colour a mismatched circle is drifting toward. */
struct SeekTarget {
    float x{0.0f};
    float y{0.0f};
    Rgb color{};
};

/** @brief Colour-adaptation cycle entered when the image under a stable circle stops matching it. */
struct Adapting {
    AdaptPhase phase{AdaptPhase::Resampling};
    std::optional<SeekTarget> seekTarget{};
    Rgb originalColor{};
};

/** @brief Timed colour fade with sine easing; independent of the lifecycle state. */
struct ColorTransition {
    Rgb from{};
    Rgb to{};
    double startMs{0.0};
    double durationMs{0.0};
};

using Lifecycle = std::variant<NoLifecycle, Growing, DynamicSpawning, Adapting>;

/** @brief How a circle entered the simulation. */
enum class CircleOrigin : std::uint8_t { Placed, Spawned };

/**
 * @struct Circle
 * @brief One packed disk: position, radius, colour, Verlet state and exactly one lifecycle state.
 *
 * Radius is only mutable through setRadius(), which clamps to >= 0 and recomputes mass = pi*r^2,
 * so the mass invariant holds immediately after every mutation.
 */
struct Circle {
    Circle() = default;
    Circle(float x_, float y_, float radius_, const Rgb& color_);

    std::uint64_t id{0};
    float x{0.0f};
    float y{0.0f};
    float prevX{0.0f};
    float prevY{0.0f};
    Rgb color{};
    bool pinned{false};
    CircleOrigin origin{CircleOrigin::Placed};
    double createdAtMs{0.0};
    double spawnProtectedUntilMs{0.0};
    Lifecycle lifecycle{NoLifecycle{}};
    std::optional<ColorTransition> colorFade{};

    float radius() const { return rad; }
    float mass() const { return massValue; }
    void setRadius(float r);
    bool isDead() const { return rad <= kDeadRadius; }
    bool isStable() const { return std::holds_alternative<NoLifecycle>(lifecycle); }
    /** @brief Move without injecting Verlet velocity (previous position follows). */
    void translate(float dx, float dy);
    /** @brief Place at (nx,ny) at rest. */
    void resetPosition(float nx, float ny);

private:
    float rad{0.0f};
    float massValue{0.0f};
};

/** @brief Flat record handed to the renderer: later entries are drawn on top. */
struct CircleRecord {
    float x{0.0f};
    float y{0.0f};
    float radius{0.0f};
    Rgb color{};
};
