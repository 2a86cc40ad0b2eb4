/**
 * @file Config.cpp
 */
#include "Config.h"
#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace {
enum class OptKind { Float, Int, Bool, Millis };

struct Option {
    const char* name;
    OptKind kind;
    float PackingConfig::* f;
    int PackingConfig::* i;
    bool PackingConfig::* b;
    double PackingConfig::* d;
    bool generation; // regenerate layout when changed
};

// One overload per member type picks the option kind.
Option opt(const char* name, float PackingConfig::* m, bool generation) {
    return Option{name, OptKind::Float, m, nullptr, nullptr, nullptr, generation};
}
Option opt(const char* name, int PackingConfig::* m, bool generation) {
    return Option{name, OptKind::Int, nullptr, m, nullptr, nullptr, generation};
}
Option opt(const char* name, bool PackingConfig::* m, bool generation) {
    return Option{name, OptKind::Bool, nullptr, nullptr, m, nullptr, generation};
}
Option opt(const char* name, double PackingConfig::* m, bool generation) {
    return Option{name, OptKind::Millis, nullptr, nullptr, nullptr, m, generation};
}

const Option kOptions[] = {
    opt("packing-density", &PackingConfig::packingDensity, true),
    opt("total-circles", &PackingConfig::totalCircles, true),
    opt("min-circle-size", &PackingConfig::minCircleSize, true),
    opt("max-circle-size", &PackingConfig::maxCircleSize, true),
    opt("circle-spacing", &PackingConfig::circleSpacing, true),
    opt("use-verlet-physics", &PackingConfig::useVerletPhysics, true),
    opt("use-physics-placement", &PackingConfig::usePhysicsPlacement, true),
    opt("enable-progressive-growth", &PackingConfig::enableProgressiveGrowth, true),
    opt("enable-color-monitoring", &PackingConfig::enableColorMonitoring, false),
    opt("enable-color-change-map", &PackingConfig::enableColorChangeMap, true),
    opt("enable-dynamic-spawning", &PackingConfig::enableDynamicSpawning, false),
    opt("gravity", &PackingConfig::gravity, true),
    opt("damping", &PackingConfig::damping, true),
    opt("substeps", &PackingConfig::substeps, true),
    opt("physics-iterations", &PackingConfig::physicsIterations, true),
    opt("growth-rate", &PackingConfig::growthRate, false),
    opt("start-size-multiplier", &PackingConfig::startSizeMultiplier, true),
    opt("color-similarity-threshold", &PackingConfig::colorSimilarityThreshold, false),
    opt("color-update-interval", &PackingConfig::colorUpdateInterval, false),
    opt("color-transition-duration", &PackingConfig::colorTransitionDuration, false),
    opt("color-animation-duration", &PackingConfig::colorAnimationDuration, false),
    opt("spawn-interval", &PackingConfig::spawnInterval, false),
    opt("max-spawns-per-check", &PackingConfig::maxSpawnsPerCheck, false),
    opt("min-empty-area-size", &PackingConfig::minEmptyAreaSize, false),
    opt("use-quad-tree", &PackingConfig::useQuadTree, true),
    opt("use-worker", &PackingConfig::useWorker, false),
};

static const Option* findOption(const std::string& name) {
    for (const auto& o : kOptions) if (name == o.name) return &o;
    return nullptr;
}

static std::string envName(const char* kebab) {
    std::string s("CIRCLES_");
    for (const char* p = kebab; *p; ++p) s.push_back(*p == '-' ? '_' : (char)std::toupper((unsigned char)*p));
    return s;
}

static bool assign(PackingConfig& cfg, const Option& o, const char* v) {
    switch (o.kind) {
        case OptKind::Float: { float t; if (!parseFloat(v, t)) return false; cfg.*(o.f) = t; return true; }
        case OptKind::Int: { int t; if (!parseInt(v, t)) return false; cfg.*(o.i) = t; return true; }
        case OptKind::Bool: { bool t; if (!parseBool(v, t)) return false; cfg.*(o.b) = t; return true; }
        case OptKind::Millis: { float t; if (!parseFloat(v, t)) return false; cfg.*(o.d) = (double)t; return true; }
    }
    return false;
}

template <typename T>
static void clampInto(T& v, T lo, T hi, T fallback, int& changed) {
    T before = v;
    if (!(v == v)) v = fallback; // NaN
    v = std::max(lo, std::min(hi, v));
    if (!(before == v)) ++changed;
}
}

bool parseFloat(const char* s, float& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || errno != 0) return false;
    out = static_cast<float>(v);
    return true;
}

bool parseInt(const char* s, int& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || errno != 0) return false;
    out = (int)std::max<long>(-1000000000L, std::min<long>(1000000000L, v));
    return true;
}

bool parseBool(const char* s, bool& out) {
    if (!s) return false;
    std::string v(s);
    for (auto& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "1" || v == "true" || v == "on" || v == "yes") { out = true; return true; }
    if (v == "0" || v == "false" || v == "off" || v == "no") { out = false; return true; }
    return false;
}

int PackingConfig::validate() {
    int changed = 0;
    clampInto(packingDensity, 0.1f, 1000.0f, 18.0f, changed);
    clampInto(totalCircles, 1, 100000, 300, changed);
    clampInto(minCircleSize, 0.1f, 1000.0f, 2.0f, changed);
    clampInto(maxCircleSize, 0.1f, 1000.0f, 40.0f, changed);
    if (minCircleSize > maxCircleSize) { std::swap(minCircleSize, maxCircleSize); ++changed; }
    clampInto(circleSpacing, 0.1f, 10.0f, 1.2f, changed);
    clampInto(gravity, 0.0f, 100.0f, 0.4f, changed);
    clampInto(damping, 0.0f, 1.0f, 0.98f, changed);
    clampInto(substeps, 1, 64, 3, changed);
    clampInto(physicsIterations, 1, 1000, 15, changed);
    clampInto(growthRate, 0.001f, 100.0f, 0.5f, changed);
    clampInto(startSizeMultiplier, 0.1f, 1.0f, 0.3f, changed);
    clampInto(colorSimilarityThreshold, 0.1f, 1.0f, 0.7f, changed);
    clampInto(colorUpdateInterval, 16.0, 600000.0, 1000.0, changed);
    clampInto(colorTransitionDuration, 1.0, 600000.0, 1500.0, changed);
    clampInto(colorAnimationDuration, 1.0, 600000.0, 500.0, changed);
    clampInto(spawnInterval, 16.0, 600000.0, 2000.0, changed);
    clampInto(maxSpawnsPerCheck, 0, 1000, 6, changed);
    clampInto(minEmptyAreaSize, 1, 1000000, 3, changed);
    if (changed > 0) Logger::warn("config: clamped " + std::to_string(changed) + " option(s) into range");
    return changed;
}

bool PackingConfig::set(const std::string& name, const std::string& value) {
    const Option* o = findOption(name);
    if (!o) return false;
    return assign(*this, *o, value.c_str());
}

void PackingConfig::applyEnv() {
    for (const auto& o : kOptions) {
        std::string en = envName(o.name);
        const char* v = std::getenv(en.c_str());
        if (!v) continue;
        if (assign(*this, o, v)) Logger::debug("config env " + en + "=" + v);
        else Logger::warn("config: ignoring unparsable " + en + "=" + v);
    }
}

void PackingConfig::applyArgs(int argc, char** argv, std::vector<std::string>* unknown) {
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto skip = [&]{
            if (unknown) unknown->push_back(a);
            else Logger::warn("config: unknown argument " + a);
        };
        if (a.rfind("--", 0) != 0) { skip(); continue; }
        std::string body = a.substr(2);
        std::string name = body, value;
        bool hasValue = false;
        size_t eq = body.find('=');
        if (eq != std::string::npos) { name = body.substr(0, eq); value = body.substr(eq + 1); hasValue = true; }
        const Option* o = findOption(name);
        if (!o) { skip(); continue; }
        if (!hasValue) {
            bool nextIsValue = (i + 1 < argc) && std::strncmp(argv[i + 1], "--", 2) != 0;
            bool probe = false;
            // bare boolean flag: --use-quad-tree
            if (o->kind == OptKind::Bool && (!nextIsValue || !parseBool(argv[i + 1], probe))) {
                this->*(o->b) = true;
                continue;
            }
            if (!nextIsValue) { Logger::warn("config: missing value for --" + name); continue; }
            value = argv[++i];
        }
        if (!assign(*this, *o, value.c_str())) Logger::warn("config: bad value for --" + name + ": " + value);
    }
}

bool PackingConfig::affectsGeneration(const PackingConfig& other) const {
    for (const auto& o : kOptions) {
        if (!o.generation) continue;
        switch (o.kind) {
            case OptKind::Float: if (this->*(o.f) != other.*(o.f)) return true; break;
            case OptKind::Int: if (this->*(o.i) != other.*(o.i)) return true; break;
            case OptKind::Bool: if (this->*(o.b) != other.*(o.b)) return true; break;
            case OptKind::Millis: if (this->*(o.d) != other.*(o.d)) return true; break;
        }
    }
    return false;
}

std::vector<std::string> PackingConfig::optionNames() {
    std::vector<std::string> out;
    for (const auto& o : kOptions) out.emplace_back(o.name);
    return out;
}

std::string PackingConfig::describe() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& o : kOptions) {
        if (!first) oss << ' ';
        first = false;
        oss << o.name << '=';
        switch (o.kind) {
            case OptKind::Float: oss << this->*(o.f); break;
            case OptKind::Int: oss << this->*(o.i); break;
            case OptKind::Bool: oss << (this->*(o.b) ? "true" : "false"); break;
            case OptKind::Millis: oss << this->*(o.d); break;
        }
    }
    return oss.str();
}
