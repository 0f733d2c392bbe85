/**
 * @file Config.cpp
 * @brief BotConfig parsing: environment overrides, argv overrides, validation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Config.h"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>

bool parseFloat(const char* s, float& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || errno != 0 || !std::isfinite(v)) return false;
    out = static_cast<float>(v);
    return true;
}

bool parseInt(const char* s, int& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno != 0 || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

namespace {
enum class Key { Width, Height, Timeout, Depth, WDistance, WSpace, WWallHug, Workers, Players, Seed, Delay, LogLevel, LogFile };

struct Option {
    Key key;
    const char* longName; /**< without leading "--" */
    const char* shortName; /**< "-x" or nullptr */
    const char* env;
    const char* help;
};

const Option kOptions[] = {
    {Key::Width,     "width",           "-W", "LIGHTCYCLE_WIDTH",           "board width (30)"},
    {Key::Height,    "height",          "-H", "LIGHTCYCLE_HEIGHT",          "board height (20)"},
    {Key::Timeout,   "timeout-ms",      "-t", "LIGHTCYCLE_TIMEOUT_MS",      "decision time budget in ms (1750)"},
    {Key::Depth,     "depth",           "-d", "LIGHTCYCLE_SPACE_DEPTH",     "flood-fill depth bound (12)"},
    {Key::WDistance, "weight-distance", nullptr, "LIGHTCYCLE_WEIGHT_DISTANCE", "distance heuristic weight (1)"},
    {Key::WSpace,    "weight-space",    nullptr, "LIGHTCYCLE_WEIGHT_SPACE",    "space heuristic weight (2)"},
    {Key::WWallHug,  "weight-wallhug",  nullptr, "LIGHTCYCLE_WEIGHT_WALLHUG",  "wall-hug heuristic weight (2)"},
    {Key::Workers,   "workers",         "-j", "LIGHTCYCLE_WORKERS",         "worker threads, 0 = one per heuristic (0)"},
    {Key::Players,   "players",         "-p", "LIGHTCYCLE_PLAYERS",         "arena: number of bots, 1-8 (2)"},
    {Key::Seed,      "seed",            "-s", "LIGHTCYCLE_SEED",            "arena: start position seed, 0 = random (0)"},
    {Key::Delay,     "delay",           nullptr, "LIGHTCYCLE_STEP_DELAY_MS", "arena: ms between turns, 5-2000 (120)"},
    {Key::LogLevel,  "log-level",       "-l", "LIGHTCYCLE_LOG_LEVEL",       "debug, info, warn, error or none (info)"},
    {Key::LogFile,   "log-file",        nullptr, "LIGHTCYCLE_LOG_FILE",     "log file path (bot: stderr, arena: ./<cmd>.log)"},
};

bool positiveWeight(const char* v, float& out) {
    float tmp;
    if (!parseFloat(v, tmp) || !(tmp > 0.0f)) return false;
    out = tmp;
    return true;
}

bool intInRange(const char* v, int lo, int hi, int& out) {
    int tmp;
    if (!parseInt(v, tmp) || tmp < lo || tmp > hi) return false;
    out = tmp;
    return true;
}

/** @brief Apply one option value; returns false when the value is rejected. */
bool assign(BotConfig& c, Key key, const char* v) {
    switch (key) {
        case Key::Width: return intInRange(v, 1, 4096, c.width);
        case Key::Height: return intInRange(v, 1, 4096, c.height);
        case Key::Timeout: return intInRange(v, 1, 600000, c.timeoutMs);
        case Key::Depth: return intInRange(v, 1, 100000, c.spaceDepth);
        case Key::WDistance: return positiveWeight(v, c.distanceWeight);
        case Key::WSpace: return positiveWeight(v, c.spaceWeight);
        case Key::WWallHug: return positiveWeight(v, c.wallHugWeight);
        case Key::Workers: return intInRange(v, 0, 256, c.workers);
        case Key::Players: return intInRange(v, 1, 8, c.players);
        case Key::Seed: {
            int tmp;
            if (!parseInt(v, tmp) || tmp < 0) return false;
            c.seed = static_cast<unsigned>(tmp);
            return true;
        }
        case Key::Delay: return intInRange(v, 5, 2000, c.stepDelayMs);
        case Key::LogLevel: return v && Logger::parseLevel(v, c.logLevel);
        case Key::LogFile:
            if (!v || !*v) return false;
            c.logFile = v;
            return true;
    }
    return false;
}
}

void BotConfig::applyEnvironment() {
    for (const auto& opt : kOptions) {
        const char* v = std::getenv(opt.env);
        if (!v) continue;
        if (!assign(*this, opt.key, v)) Logger::warn(std::string("ignoring invalid ") + opt.env + "=" + v);
    }
}

std::vector<std::string> BotConfig::applyArgs(int argc, const char* const* argv) {
    std::vector<std::string> unknown;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto read_next = [&](int& idx) -> const char* {
            if (idx + 1 < argc) return argv[++idx];
            return nullptr;
        };
        bool matched = false;
        for (const auto& opt : kOptions) {
            std::string longFlag = std::string("--") + opt.longName;
            const char* v = nullptr;
            if (a == longFlag || (opt.shortName && a == opt.shortName)) {
                v = read_next(i);
            } else if (a.rfind(longFlag + "=", 0) == 0) {
                v = a.c_str() + longFlag.size() + 1;
            } else {
                continue;
            }
            matched = true;
            if (!assign(*this, opt.key, v)) {
                Logger::warn("ignoring invalid value for " + longFlag + ": " + (v ? v : "<missing>"));
            }
            break;
        }
        if (!matched) unknown.push_back(a);
    }
    return unknown;
}

std::string BotConfig::describe() const {
    std::ostringstream oss;
    oss << "board=" << width << "x" << height
        << " timeoutMs=" << timeoutMs
        << " depth=" << spaceDepth
        << " weights(distance/space/wallhug)=" << distanceWeight << "/" << spaceWeight << "/" << wallHugWeight
        << " workers=" << workers
        << " players=" << players
        << " seed=" << seed;
    return oss.str();
}

std::string BotConfig::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "usage: " << program << " [options]\n";
    for (const auto& opt : kOptions) {
        std::string flag = std::string("--") + opt.longName + "=V";
        if (opt.shortName) flag += std::string(", ") + opt.shortName + " V";
        oss << "  " << flag;
        for (size_t pad = flag.size(); pad < 28; ++pad) oss << ' ';
        oss << opt.help << "  [" << opt.env << "]\n";
    }
    return oss.str();
}
