/**
 * @file ColorSampler.cpp
 */
#include "ColorSampler.h"
#include "Logger.h"

#include <system_error>

ColorSampler::ColorSampler(Mode mode, unsigned seed)
    : mode_(mode), rng(seed) {
    if (mode_ == Mode::Threaded) {
        try {
            worker = std::thread([this]{ run(); });
        } catch (const std::system_error& e) {
            Logger::logException("color sampler thread unavailable, sampling inline", e);
            mode_ = Mode::Inline;
        }
    }
}

ColorSampler::~ColorSampler() { stop(); }

void ColorSampler::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx);
        stopping = true;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();
}

void ColorSampler::setSource(std::shared_ptr<const Raster> raster) {
    std::lock_guard<std::mutex> lk(mtx);
    source = std::move(raster);
}

SampleResponse ColorSampler::process(const SampleRequest& req, const std::shared_ptr<const Raster>& src) {
    SampleResponse resp;
    resp.circleId = req.circleId;
    resp.x = req.x;
    resp.y = req.y;
    resp.radius = req.radius;
    if (!src || src->empty()) {
        resp.error = "no source raster";
        return resp;
    }
    if (req.x < 0.0f || req.y < 0.0f || req.x >= (float)src->width() || req.y >= (float)src->height()) {
        resp.error = "sample position outside raster";
        return resp;
    }
    resp.color = src->averageInDisk(req.x, req.y, req.radius, rng);
    resp.ok = true;
    return resp;
}

void ColorSampler::submit(const SampleRequest& req) {
    if (mode_ == Mode::Inline) {
        std::shared_ptr<const Raster> src;
        {
            std::lock_guard<std::mutex> lk(mtx);
            src = source;
        }
        SampleResponse r = process(req, src);
        std::lock_guard<std::mutex> lk(mtx);
        responses.push_back(std::move(r));
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (stopping) return;
        requests.push_back(req);
        ++inFlight;
    }
    cv.notify_one();
}

void ColorSampler::run() {
    std::unique_lock<std::mutex> lk(mtx);
    while (true) {
        cv.wait(lk, [this]{ return stopping || !requests.empty(); });
        if (stopping) break;
        SampleRequest req = requests.front();
        requests.pop_front();
        std::shared_ptr<const Raster> src = source;
        lk.unlock();
        SampleResponse r = process(req, src);
        lk.lock();
        responses.push_back(std::move(r));
        --inFlight;
        if (inFlight == 0) idleCv.notify_all();
    }
    // Unanswered requests are dropped on shutdown.
    inFlight = 0;
    requests.clear();
    idleCv.notify_all();
}

std::vector<SampleResponse> ColorSampler::drain() {
    std::lock_guard<std::mutex> lk(mtx);
    std::vector<SampleResponse> out;
    out.swap(responses);
    return out;
}

std::size_t ColorSampler::pending() const {
    std::lock_guard<std::mutex> lk(mtx);
    return inFlight;
}

void ColorSampler::waitIdle() {
    std::unique_lock<std::mutex> lk(mtx);
    idleCv.wait(lk, [this]{ return inFlight == 0 || stopping; });
}
