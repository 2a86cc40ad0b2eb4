#include "TestSupport.h"

#include "Logger.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

const char* kLogFile = "test_logger_tmp.log";

std::string readAll(const char* path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

void testSilentBeforeInit() {
    std::remove(kLogFile);
    Logger::warn("before init");
    std::ifstream in(kLogFile);
    REQUIRE(!in.good(), "nothing written before init");
}

void testLevelFromEnvironment() {
    std::remove(kLogFile);
    setenv("CIRCLES_LOG_LEVEL", "Warning", 1);
    Logger::init(kLogFile);
    unsetenv("CIRCLES_LOG_LEVEL");
    Logger::info("layout adopted");
    Logger::debug("stale sample");
    Logger::warn("config clamped");
    Logger::logException("synchronous generation", std::runtime_error("boom"));
    Logger::shutdown();
    Logger::shutdown();

    std::string text = readAll(kLogFile);
    REQUIRE(text.find("===== session start") != std::string::npos, "session header");
    REQUIRE(text.find("===== session end") != std::string::npos, "session footer");
    REQUIRE(text.find("layout adopted") == std::string::npos, "info filtered at warn level");
    REQUIRE(text.find("stale sample") == std::string::npos, "debug filtered at warn level");
    REQUIRE(text.find("[WARN]") != std::string::npos && text.find("config clamped") != std::string::npos, "warn kept");
    REQUIRE(text.find("[ERROR]") != std::string::npos && text.find("synchronous generation: boom") != std::string::npos,
            "exception logged with its origin");

    Logger::warn("after shutdown");
    REQUIRE(readAll(kLogFile).find("after shutdown") == std::string::npos, "closed logger is silent");
    std::remove(kLogFile);
}

} // namespace

int main() {
    testSilentBeforeInit();
    testLevelFromEnvironment();
    std::cout << "[PASS] test_logger\n";
    return 0;
}
