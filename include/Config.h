/**
 * @file Config.h
 * @brief Packing parameters with defaults, environment/argv overrides and range clamping.
 */
#pragma once

#include <string>
#include <vector>

/**
 * @struct PackingConfig
 * @brief Every tunable of the packing pipeline. Precedence: defaults < CIRCLES_* environment < --flags.
 */
struct PackingConfig {
    float packingDensity{18.0f};
    int totalCircles{300};
    float minCircleSize{2.0f};
    float maxCircleSize{40.0f};
    float circleSpacing{1.2f};

    bool useVerletPhysics{true};
    bool usePhysicsPlacement{false};
    bool enableProgressiveGrowth{true};
    bool enableColorMonitoring{true};
    bool enableColorChangeMap{true};
    bool enableDynamicSpawning{true};

    float gravity{0.4f};
    float damping{0.98f};
    int substeps{3};
    int physicsIterations{15};
    float growthRate{0.5f};
    float startSizeMultiplier{0.3f};
    float colorSimilarityThreshold{0.7f};
    double colorUpdateInterval{1000.0}; // ms
    double colorTransitionDuration{1500.0}; // ms, fade to the final sampled colour after growth
    double colorAnimationDuration{500.0};   // ms, fade toward a seek target colour
    double spawnInterval{2000.0};       // ms
    int maxSpawnsPerCheck{6};
    int minEmptyAreaSize{3};

    bool useQuadTree{false};
    bool useWorker{true};

    // Clamp every option into its legal range; returns the number of values changed.
    int validate();
    // Apply CIRCLES_<OPTION> environment variables.
    void applyEnv();
    // Apply --option=value / --option value flags. Unrecognized arguments are appended to @p unknown
    // (when given) and logged; argv[0] is skipped.
    void applyArgs(int argc, char** argv, std::vector<std::string>* unknown = nullptr);
    // Set one option by its kebab-case name; false if the name is unknown or the value does not parse.
    bool set(const std::string& name, const std::string& value);
    // True when a change between *this and @p other requires regenerating the layout.
    bool affectsGeneration(const PackingConfig& other) const;
    // Known kebab-case option names, in declaration order.
    static std::vector<std::string> optionNames();
    std::string describe() const;
};

bool parseFloat(const char* s, float& out);
bool parseInt(const char* s, int& out);
bool parseBool(const char* s, bool& out);
