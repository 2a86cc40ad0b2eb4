/**
 * @file GenerationWorker.cpp
 */
#include "GenerationWorker.h"
#include "Logger.h"

#include <iterator>
#include <system_error>

std::vector<Circle> GenerationWorker::defaultJob(const GenerationRequest& req, const ProgressFn& progress) {
    PlacementEngine engine(req.config, req.seed);
    return engine.generateLayout(req.raster, req.changeMap ? &*req.changeMap : nullptr, progress);
}

GenerationWorker::GenerationWorker()
    : job(&GenerationWorker::defaultJob) {}

GenerationWorker::GenerationWorker(Job j)
    : job(j ? std::move(j) : Job(&GenerationWorker::defaultJob)) {}

GenerationWorker::~GenerationWorker() { stop(); }

bool GenerationWorker::start() {
    if (th.joinable()) return true;
    {
        std::lock_guard<std::mutex> lk(mtx);
        exitFlag = false;
    }
    try {
        th = std::thread([this]{ run(); });
    } catch (const std::system_error& e) {
        Logger::logException("generation worker unavailable", e);
        return false;
    }
    alive.store(true);
    return true;
}

void GenerationWorker::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx);
        exitFlag = true;
    }
    cv.notify_all();
    if (th.joinable()) th.join();
    alive.store(false);
}

bool GenerationWorker::submit(GenerationRequest req) {
    if (!alive.load()) return false;
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (isBusy.load() || slot) return false;
        slot = std::move(req);
        isBusy.store(true);
    }
    cv.notify_one();
    return true;
}

void GenerationWorker::post(GenerationMessage msg) {
    std::lock_guard<std::mutex> lk(mtx);
    outbox.push_back(std::move(msg));
}

std::vector<GenerationMessage> GenerationWorker::poll() {
    std::lock_guard<std::mutex> lk(mtx);
    std::vector<GenerationMessage> out(std::make_move_iterator(outbox.begin()), std::make_move_iterator(outbox.end()));
    outbox.clear();
    return out;
}

void GenerationWorker::run() {
    while (true) {
        GenerationRequest req;
        {
            std::unique_lock<std::mutex> lk(mtx);
            cv.wait(lk, [this]{ return exitFlag || slot.has_value(); });
            if (exitFlag) break;
            req = std::move(*slot);
            slot.reset();
        }
        const std::uint64_t id = req.id;
        auto progress = [this, id](const std::string& phase, int pct) {
            GenerationMessage m;
            m.kind = GenerationMessage::Kind::Progress;
            m.requestId = id;
            m.phase = phase;
            m.percent = pct;
            post(std::move(m));
        };
        GenerationMessage done;
        done.requestId = id;
        try {
            done.circles = job(req, progress);
            if (done.circles.empty()) {
                done.kind = GenerationMessage::Kind::Error;
                done.error = "generation produced no circles";
            } else {
                done.kind = GenerationMessage::Kind::Result;
                done.percent = 100;
            }
        } catch (const std::exception& e) {
            Logger::logException("generation worker", e);
            done.kind = GenerationMessage::Kind::Error;
            done.error = e.what();
            done.circles.clear();
        } catch (...) {
            Logger::logUnknownException("generation worker");
            done.kind = GenerationMessage::Kind::Error;
            done.error = "unknown exception";
            done.circles.clear();
        }
        {
            // Queue the outcome and clear busy together so a poller never sees idle without it.
            std::lock_guard<std::mutex> lk(mtx);
            outbox.push_back(std::move(done));
            isBusy.store(false);
        }
    }
}
