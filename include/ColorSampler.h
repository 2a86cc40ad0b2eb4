/**
 * @file ColorSampler.h
 * @brief Asynchronous colour readback: requests carry the circle position at issue time so that
 *        stale responses can be recognised when they come back.
 */
#pragma once

#include "Raster.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

struct SampleRequest {
    std::uint64_t circleId{0};
    float x{0.0f};
    float y{0.0f};
    float radius{0.0f};
};

struct SampleResponse {
    std::uint64_t circleId{0};
    float x{0.0f};      /**< position recorded when the request was issued */
    float y{0.0f};
    float radius{0.0f};
    Rgb color{};
    bool ok{false};
    std::string error;
};

class ColorSampler {
public:
    enum class Mode { Inline, Threaded };

    explicit ColorSampler(Mode mode = Mode::Threaded, unsigned seed = 0x5eed);
    ~ColorSampler();
    ColorSampler(const ColorSampler&) = delete;
    ColorSampler& operator=(const ColorSampler&) = delete;

    /** @brief Raster snapshot later requests read from; shared read-only with the sampling thread. */
    void setSource(std::shared_ptr<const Raster> raster);
    void submit(const SampleRequest& req);
    /** @brief Take every completed response; never blocks. */
    std::vector<SampleResponse> drain();
    /** @brief Requests submitted but not yet answered. */
    std::size_t pending() const;
    /** @brief Block until every submitted request has a response (tests, shutdown). */
    void waitIdle();
    void stop();
    Mode mode() const { return mode_; }

private:
    SampleResponse process(const SampleRequest& req, const std::shared_ptr<const Raster>& src);
    void run();

    Mode mode_;
    std::mt19937 rng;
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::condition_variable idleCv;
    std::deque<SampleRequest> requests;
    std::vector<SampleResponse> responses;
    std::shared_ptr<const Raster> source;
    std::size_t inFlight{0};
    bool stopping{false};
    std::thread worker;
};
