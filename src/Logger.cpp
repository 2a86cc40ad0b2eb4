/**
 * @file Logger.cpp
 */
#include "Logger.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace {
std::mutex g_logMtx;
std::ofstream g_log;
bool g_inited = false;
std::atomic<int> g_level{static_cast<int>(Logger::Level::Info)};
std::atomic<bool> g_echo{false};

static std::string basenameFromPath(const std::string& p) {
    if (p.empty()) return std::string("circles");
    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) return p;
    if (pos + 1 >= p.size()) return std::string("circles");
    return p.substr(pos + 1);
}

static std::string nowTs() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    auto t = system_clock::to_time_t(tp);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    std::tm tmv;
#if defined(_WIN32)
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

static const char* levelName(Logger::Level lvl) {
    switch (lvl) {
        case Logger::Level::Debug: return "DEBUG";
        case Logger::Level::Info: return "INFO";
        case Logger::Level::Warn: return "WARN";
        case Logger::Level::Error: return "ERROR";
        default: return "NONE";
    }
}

// Unknown names leave @p out untouched.
static bool parseLevel(const std::string& name, Logger::Level& out) {
    std::string v(name);
    for (auto& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "debug") out = Logger::Level::Debug;
    else if (v == "info") out = Logger::Level::Info;
    else if (v == "warn" || v == "warning") out = Logger::Level::Warn;
    else if (v == "error") out = Logger::Level::Error;
    else if (v == "none" || v == "off") out = Logger::Level::None;
    else return false;
    return true;
}

static void setLevelFromEnv() {
    const char* s = std::getenv("CIRCLES_LOG_LEVEL");
    if (!s) return;
    Logger::Level lvl;
    if (parseLevel(s, lvl)) g_level.store(static_cast<int>(lvl));
}
}

void Logger::initFromArgv0(const char* argv0) {
    std::string base = basenameFromPath(argv0 ? std::string(argv0) : std::string("circles"));
    if (base.empty()) base = "circles";
    init(std::string("./") + base + ".log");
}

void Logger::init(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (g_inited) return;
    // Append to preserve prior runs; we also mark a session header.
    g_log.open(filename, std::ios::out | std::ios::app);
    if (g_log.is_open()) {
        g_inited = true;
        setLevelFromEnv();
        g_log << "===== session start " << nowTs() << " =====" << '\n';
        g_log.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (!g_inited) return;
    g_log << "===== session end   " << nowTs() << " =====" << std::endl;
    g_log.flush();
    g_log.close();
    g_inited = false;
}

void Logger::logImpl(Level lvl, const std::string& msg) {
    if ((int)lvl < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (g_echo.load() && lvl >= Level::Warn) std::cerr << "[" << levelName(lvl) << "] " << msg << '\n';
    if (!g_inited || !g_log.is_open()) return;
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    g_log << nowTs() << " [" << levelName(lvl) << "] [t:" << tid.str() << "] " << msg << '\n';
    if (lvl >= Level::Warn) g_log.flush();
}

void Logger::info(const std::string& msg) { logImpl(Level::Info, msg); }
void Logger::warn(const std::string& msg) { logImpl(Level::Warn, msg); }
void Logger::error(const std::string& msg) { logImpl(Level::Error, msg); }
void Logger::debug(const std::string& msg) { logImpl(Level::Debug, msg); }

void Logger::logException(const std::string& where, const std::exception& e) {
    logImpl(Level::Error, where + ": " + e.what());
}

void Logger::logUnknownException(const std::string& where) {
    logImpl(Level::Error, where + ": unknown exception");
}

void Logger::setEcho(bool on) { g_echo.store(on); }
