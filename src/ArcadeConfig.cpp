/**
 * @file ArcadeConfig.cpp
 * @brief Option parsing for the terminal showcase.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ArcadeConfig.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

bool parseDouble(const char* s, double& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (errno != 0 || end == s || *end != '\0') return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parseUint32(const char* s, uint32_t& out) {
    if (!s || !*s || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0') return false;
    if (v > 0xFFFFFFFFULL) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

void DemoOptions::applyEnvironment() {
    double d;
    uint32_t u;
    if (parseDouble(std::getenv("ARCADE_RATE"), d)) spriteRate = d;
    if (parseDouble(std::getenv("ARCADE_LOOP_RATE"), d)) loopRate = d;
    if (parseUint32(std::getenv("ARCADE_SEED"), u)) { seed = u; hasSeed = true; }
}

void DemoOptions::applyArgs(int argc, char** argv) {
    double d;
    uint32_t u;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto read_next = [&](int& idx) -> const char* {
            if (idx + 1 < argc) return argv[++idx];
            return nullptr;
        };
        if (a == "-r" || a == "--rate") {
            if (parseDouble(read_next(i), d)) spriteRate = d;
        } else if (a.rfind("--rate=", 0) == 0) {
            if (parseDouble(a.c_str() + std::strlen("--rate="), d)) spriteRate = d;
        } else if (a == "-l" || a == "--loop-rate") {
            if (parseDouble(read_next(i), d)) loopRate = d;
        } else if (a.rfind("--loop-rate=", 0) == 0) {
            if (parseDouble(a.c_str() + std::strlen("--loop-rate="), d)) loopRate = d;
        } else if (a == "-s" || a == "--seed") {
            if (parseUint32(read_next(i), u)) { seed = u; hasSeed = true; }
        } else if (a.rfind("--seed=", 0) == 0) {
            if (parseUint32(a.c_str() + std::strlen("--seed="), u)) { seed = u; hasSeed = true; }
        } else if (a == "-v" || a == "--verbose") {
            verbosity = Verbosity::Verbose;
        } else if (a == "-q" || a == "--quiet") {
            verbosity = Verbosity::Quiet;
        } else {
            Logger::warn("ignoring unknown argument: " + a);
        }
    }
}

void DemoOptions::validate() {
    if (!(spriteRate > 0.0 && spriteRate <= arcade_config::HostFrameRate)) {
        spriteRate = arcade_config::SpriteUpdateRate;
    }
    if (!(loopRate >= arcade_config::MinLoopUpdateRate && loopRate <= arcade_config::MaxLoopUpdateRate)) {
        loopRate = arcade_config::LoopUpdateRate;
    }
}
