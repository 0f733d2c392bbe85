// tests/test_config.cpp (doctest)
#include <doctest/doctest.h>

#include "Config.h"

#include <cstdlib>
#include <string>
#include <vector>

namespace {
std::vector<std::string> apply(BotConfig& cfg, std::vector<const char*> args) {
    args.insert(args.begin(), "lightcycle");
    return cfg.applyArgs(static_cast<int>(args.size()), args.data());
}
}

TEST_CASE("config: defaults") {
    BotConfig cfg;
    CHECK(cfg.width == 30);
    CHECK(cfg.height == 20);
    CHECK(cfg.timeoutMs == 1750);
    CHECK(cfg.spaceDepth == 12);
    CHECK(cfg.distanceWeight == doctest::Approx(1.0f));
    CHECK(cfg.spaceWeight == doctest::Approx(2.0f));
    CHECK(cfg.wallHugWeight == doctest::Approx(2.0f));
    CHECK(cfg.workers == 0);
    CHECK(cfg.players == 2);
    CHECK(cfg.logLevel == Logger::Level::Info);
}

TEST_CASE("config: long, short and inline flag forms") {
    BotConfig cfg;
    auto unknown = apply(cfg, {"--width", "40", "-H", "25", "--timeout-ms=900", "--weight-space=3.5",
                               "-l", "debug", "--log-file=/tmp/lc.log", "-s", "7"});
    CHECK(unknown.empty());
    CHECK(cfg.width == 40);
    CHECK(cfg.height == 25);
    CHECK(cfg.timeoutMs == 900);
    CHECK(cfg.spaceWeight == doctest::Approx(3.5f));
    CHECK(cfg.logLevel == Logger::Level::Debug);
    CHECK(cfg.logFile == "/tmp/lc.log");
    CHECK(cfg.seed == 7u);
}

TEST_CASE("config: invalid values keep the previous setting") {
    BotConfig cfg;
    auto unknown = apply(cfg, {"--width", "0", "--depth=abc", "--weight-distance=-1", "--players", "9",
                               "--delay=1", "-l", "loud", "--timeout-ms=12x"});
    CHECK(unknown.empty());
    CHECK(cfg.width == 30);
    CHECK(cfg.spaceDepth == 12);
    CHECK(cfg.distanceWeight == doctest::Approx(1.0f));
    CHECK(cfg.players == 2);
    CHECK(cfg.stepDelayMs == 120);
    CHECK(cfg.logLevel == Logger::Level::Info);
    CHECK(cfg.timeoutMs == 1750);
}

TEST_CASE("config: a flag without its value is ignored") {
    BotConfig cfg;
    CHECK(apply(cfg, {"--workers"}).empty());
    CHECK(cfg.workers == 0);
}

TEST_CASE("config: unknown arguments are handed back in order") {
    BotConfig cfg;
    auto unknown = apply(cfg, {"--help", "-j", "4", "extra"});
    REQUIRE(unknown.size() == 2);
    CHECK(unknown[0] == "--help");
    CHECK(unknown[1] == "extra");
    CHECK(cfg.workers == 4);
}

TEST_CASE("config: environment overrides, then argv wins") {
    setenv("LIGHTCYCLE_WIDTH", "50", 1);
    setenv("LIGHTCYCLE_WEIGHT_WALLHUG", "0.75", 1);
    setenv("LIGHTCYCLE_SPACE_DEPTH", "nope", 1);
    BotConfig cfg;
    cfg.applyEnvironment();
    unsetenv("LIGHTCYCLE_WIDTH");
    unsetenv("LIGHTCYCLE_WEIGHT_WALLHUG");
    unsetenv("LIGHTCYCLE_SPACE_DEPTH");
    CHECK(cfg.width == 50);
    CHECK(cfg.wallHugWeight == doctest::Approx(0.75f));
    CHECK(cfg.spaceDepth == 12);

    apply(cfg, {"-W", "60"});
    CHECK(cfg.width == 60);
}

TEST_CASE("config: number parsing consumes the whole string") {
    int i = -1;
    CHECK(parseInt("42", i));
    CHECK(i == 42);
    CHECK(parseInt("-3", i));
    CHECK(i == -3);
    CHECK_FALSE(parseInt("", i));
    CHECK_FALSE(parseInt(nullptr, i));
    CHECK_FALSE(parseInt("4x", i));
    CHECK_FALSE(parseInt("99999999999999999999", i));
    CHECK(i == -3);

    float f = 0.0f;
    CHECK(parseFloat("2.5", f));
    CHECK(f == doctest::Approx(2.5f));
    CHECK_FALSE(parseFloat("2.5.1", f));
    CHECK_FALSE(parseFloat("nan", f));
    CHECK_FALSE(parseFloat("1e999", f));
    CHECK(f == doctest::Approx(2.5f));
}

TEST_CASE("config: usage lists every flag with its variable") {
    const std::string text = BotConfig::usage("lightcycle");
    CHECK(text.find("usage: lightcycle") == 0);
    for (const char* flag : {"--width", "--height", "--timeout-ms", "--depth", "--weight-distance", "--weight-space",
                             "--weight-wallhug", "--workers", "--players", "--seed", "--delay", "--log-level",
                             "--log-file", "LIGHTCYCLE_TIMEOUT_MS"}) {
        CAPTURE(flag);
        CHECK(text.find(flag) != std::string::npos);
    }
}

TEST_CASE("config: describe summarizes the decision settings") {
    BotConfig cfg;
    const std::string d = cfg.describe();
    CHECK(d.find("board=30x20") != std::string::npos);
    CHECK(d.find("timeoutMs=1750") != std::string::npos);
}
