/**
 * @file main.cpp
 * @brief circles entry point: terminal preview (or headless run) of the circle-packing simulation.
 */
#include <ncurses.h>
#include <algorithm>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <cstring>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "Config.h"
#include "Logger.h"
#include "Orchestrator.h"
#include "PatternSource.h"
#include "Raster.h"
#include "TerminalView.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Suspend: restore tty, then stop process with default action
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{}; sa.sa_handler = SIG_DFL; sigemptyset(&sa.sa_mask); sa.sa_flags = 0; sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume: restore curses state and redraw
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    TerminalView::initColors();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

/** @brief Front-end options; everything else on the command line belongs to PackingConfig. */
struct FrontOptions {
    bool headless{false};
    int frames{600};
    int width{1000};
    int height{800};
    unsigned seed{0};
    bool haveSeed{false};
    std::string image;
};

static bool takeValue(const std::vector<std::string>& args, size_t& i, const char* name, std::string& out) {
    const std::string& a = args[i];
    std::string eq = std::string(name) + "=";
    if (a.rfind(eq, 0) == 0) { out = a.substr(eq.size()); return true; }
    if (a == name && i + 1 < args.size()) { out = args[++i]; return true; }
    return false;
}

static void parseFrontOptions(const std::vector<std::string>& args, FrontOptions& fo) {
    for (size_t i = 0; i < args.size(); ++i) {
        std::string v;
        int tmp;
        if (args[i] == "--headless") {
            fo.headless = true;
        } else if (takeValue(args, i, "--frames", v)) {
            if (parseInt(v.c_str(), tmp) && tmp > 0) fo.frames = tmp;
            else Logger::warn("ignoring --frames=" + v);
        } else if (takeValue(args, i, "--width", v)) {
            if (parseInt(v.c_str(), tmp) && tmp > 0) fo.width = tmp;
            else Logger::warn("ignoring --width=" + v);
        } else if (takeValue(args, i, "--height", v)) {
            if (parseInt(v.c_str(), tmp) && tmp > 0) fo.height = tmp;
            else Logger::warn("ignoring --height=" + v);
        } else if (takeValue(args, i, "--seed", v)) {
            if (parseInt(v.c_str(), tmp)) { fo.seed = (unsigned)tmp; fo.haveSeed = true; }
            else Logger::warn("ignoring --seed=" + v);
        } else if (takeValue(args, i, "--image", v)) {
            fo.image = v;
        } else {
            Logger::warn("unknown argument: " + args[i]);
        }
    }
}

/** @brief The image the layout follows: a fixed image file or the animated built-in pattern. */
class RasterSource {
public:
    explicit RasterSource(const FrontOptions& fo)
        : animated(fo.image.empty()),
          raster(fo.image.empty() ? Raster(fo.width, fo.height) : Raster::loadImage(fo.image)) {
        if (animated) renderPattern(raster, 0.0);
    }
    const Raster& at(double tSeconds) {
        if (animated) renderPattern(raster, tSeconds);
        return raster;
    }
    bool isAnimated() const { return animated; }

private:
    bool animated;
    Raster raster;
};

static ViewStatus makeStatus(const Orchestrator& orch, bool running, int delayMs) {
    ViewStatus st;
    st.circles = orch.circles().size();
    st.shown = orch.output().size();
    st.spawned = orch.context().totalSpawned;
    st.generation = orch.context().generation;
    st.generating = orch.status().generating;
    st.phase = orch.status().phase;
    st.percent = orch.status().percent;
    st.running = running;
    st.delayMs = delayMs;
    return st;
}

static int runHeadless(Orchestrator& orch, RasterSource& source, const FrontOptions& fo) {
    const double dtMs = 16.0;
    double simMs = 0.0;
    int frames = 0;
    while (frames < fo.frames && !g_stop) {
        if (orch.status().generating) {
            // Hold the clock while the worker builds the layout.
            orch.frame(source.at(simMs / 1000.0), 0.0);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        simMs += dtMs;
        orch.frame(source.at(simMs / 1000.0), dtMs);
        ++frames;
    }
    const auto out = orch.output();
    std::printf("frames=%d layouts=%llu circles=%zu shown=%zu spawned=%d fallbacks=%d%s%s\n",
                frames, (unsigned long long)orch.context().generation, orch.circles().size(), out.size(),
                orch.context().totalSpawned, orch.status().fallbacks,
                orch.status().lastError.empty() ? "" : " last-error=",
                orch.status().lastError.c_str());
    Logger::info("headless run finished after " + std::to_string(frames) + " frames");
    return orch.circles().empty() ? 1 : 0;
}

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "circles");
    Logger::info("circles starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (circles)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (circles)"); }
            } else {
                Logger::error("std::terminate (circles): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Defaults < CIRCLES_* environment < flags
    PackingConfig cfg;
    cfg.applyEnv();
    std::vector<std::string> rest;
    cfg.applyArgs(argc, argv, &rest);
    FrontOptions fo;
    parseFrontOptions(rest, fo);
    if (fo.headless) Logger::setEcho(true);

    RasterSource source(fo);
    unsigned seed = fo.haveSeed ? fo.seed : std::random_device{}();
    Logger::info("seed = " + std::to_string(seed));
    Orchestrator orch(cfg, seed);

    if (fo.headless) {
        int rc = runHeadless(orch, source, fo);
        Logger::info("circles terminating");
        Logger::shutdown();
        return rc;
    }

    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    TerminalView::initColors();

    int rows, cols; getmaxyx(stdscr, rows, cols);
    if (rows < 2 || cols < 1) { Logger::error("terminal too small"); endwin(); g_curses_inited = false; Logger::shutdown(); return 1; }

    TerminalView view;
    const Raster& first = source.at(0.0);
    int canvasW = first.width(), canvasH = first.height();
    bool running = true;
    int delayMs = 16;
    double simMs = 0.0;

    bool done = false;
    using namespace std::chrono;
    auto lastStep = steady_clock::now();
    while (!done) {
        if (g_stop) done = true;
        bool redraw = false;
        if (g_needs_full_redraw) {
            redraw = true;
            g_needs_full_redraw = 0;
        }
        // Run simulation frames on the configured cadence
        auto now = steady_clock::now();
        if (running) {
            int msDesired = delayMs < 1 ? 1 : delayMs;
            auto elapsed = duration_cast<milliseconds>(now - lastStep).count();
            if (elapsed >= msDesired) {
                double dt = orch.status().generating ? 0.0 : (double)elapsed;
                simMs += dt;
                orch.frame(source.at(simMs / 1000.0), dt);
                lastStep = now;
                redraw = true;
            }
        } else {
            // keep time reference fresh while paused; still pick up worker results
            lastStep = now;
            if (orch.status().generating) {
                orch.frame(source.at(simMs / 1000.0), 0.0);
                redraw = true;
            }
        }
        if (redraw) view.drawAll(stdscr, orch.output(), canvasW, canvasH);
        view.drawStatusLine(stdscr, makeStatus(orch, running, delayMs));
        doupdate();
        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested"); done = true; break;
            case 's': case 'S':
                running = !running; Logger::info(std::string("running = ") + (running ? "true" : "false")); break;
            case 'p': case 'P':
                running = false; Logger::info("paused"); break;
            case 'r': case 'R':
                orch.requestRegeneration(); Logger::info("regeneration requested"); break;
            case '+':
                delayMs = std::max(0, delayMs - 5); Logger::info("delay set(ms): " + std::to_string(delayMs)); break;
            case '-':
                delayMs = std::min(1000, delayMs + 5); Logger::info("delay set(ms): " + std::to_string(delayMs)); break;
            case KEY_RESIZE:
                g_needs_full_redraw = 1; break;
            default:
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    endwin();
    g_curses_inited = false;
    Logger::info("circles terminating");
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (circles)", e);
        std::fprintf(stderr, "circles: %s\n", e.what());
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (circles)");
        Logger::shutdown();
        return 2;
    }
}
