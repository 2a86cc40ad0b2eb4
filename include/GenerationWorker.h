/**
 * @file GenerationWorker.h
 * @brief Background thread running one layout generation at a time and reporting over a message queue.
 */
#pragma once

#include "Circle.h"
#include "ColorChangeTracker.h"
#include "Config.h"
#include "PlacementEngine.h"
#include "Raster.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct GenerationRequest {
    std::uint64_t id{0};
    Raster raster;
    std::optional<ColorChangeMap> changeMap;
    PackingConfig config;
    unsigned seed{0};
};

struct GenerationMessage {
    enum class Kind { Progress, Result, Error };
    Kind kind{Kind::Progress};
    std::uint64_t requestId{0};
    std::string phase;
    int percent{0};
    std::string error;
    std::vector<Circle> circles;
};

class GenerationWorker {
public:
    using Job = std::function<std::vector<Circle>(const GenerationRequest&, const ProgressFn&)>;

    /** @brief Default job: PlacementEngine::generateLayout. */
    GenerationWorker();
    explicit GenerationWorker(Job job);
    ~GenerationWorker();
    GenerationWorker(const GenerationWorker&) = delete;
    GenerationWorker& operator=(const GenerationWorker&) = delete;

    /** @brief Launch the thread; false when it cannot be created. */
    bool start();
    void stop();
    bool running() const { return alive.load(); }
    /** @brief True from submit until the Result/Error message is queued. */
    bool busy() const { return isBusy.load(); }

    /** @brief Hand over a request; refused (false) while busy or not running. */
    bool submit(GenerationRequest req);
    /** @brief Take all queued messages in arrival order; never blocks. */
    std::vector<GenerationMessage> poll();

    static std::vector<Circle> defaultJob(const GenerationRequest& req, const ProgressFn& progress);

private:
    void run();
    void post(GenerationMessage msg);

    Job job;
    std::thread th;
    std::mutex mtx;
    std::condition_variable cv;
    std::optional<GenerationRequest> slot;
    std::deque<GenerationMessage> outbox;
    bool exitFlag{false};
    std::atomic<bool> alive{false};
    std::atomic<bool> isBusy{false};
};
