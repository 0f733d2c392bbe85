/**
 * @file main.cpp
 * @brief Bot entry: reads the per-turn player positions from stdin and prints one direction per turn.
 *
 * Turn input: "N P", then N lines "X0 Y0 X1 Y1" (all -1 once a player is eliminated).
 * Output: a single line UP, DOWN, LEFT or RIGHT. Logs go to stderr (or --log-file).
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "Config.h"
#include "Logger.h"
#include "Session.h"

/** @brief Program entry: configure, then answer turns until stdin closes. */
int main(int argc, char** argv) {
    BotConfig cfg;
    cfg.applyEnvironment();
    std::vector<std::string> unknown = cfg.applyArgs(argc, argv);
    for (const auto& a : unknown) {
        if (a == "-h" || a == "--help") {
            std::cerr << BotConfig::usage(argc > 0 ? argv[0] : "lightcycle");
            return 0;
        }
    }

    if (!cfg.logFile.empty()) Logger::init(cfg.logFile);
    else Logger::initStderr();
    Logger::setLevel(cfg.logLevel);
    for (const auto& a : unknown) Logger::warn("ignoring unknown argument: " + a);
    Logger::info("lightcycle starting");

    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (lightcycle)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (lightcycle)"); }
            } else {
                Logger::error("std::terminate (lightcycle): no active exception");
            }
        } catch (...) {}
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    Session session(cfg);

    int n, p;
    while (std::cin >> n >> p) {
        for (int i = 0; i < n; ++i) {
            int x0, y0, x1, y1;
            if (!(std::cin >> x0 >> y0 >> x1 >> y1)) {
                Logger::error("truncated turn input for player " + std::to_string(i));
                Logger::shutdown();
                return 1;
            }
            if ((x0 | y0 | x1 | y1) < 0) session.ingestTurn(i, std::nullopt, Coordinates(x1, y1));
            else session.ingestTurn(i, Coordinates(x0, y0), Coordinates(x1, y1));
        }
        // A single line with UP, DOWN, LEFT or RIGHT
        std::cout << toString(session.decide(p)) << std::endl;
    }

    Logger::info("lightcycle terminating: input closed");
    } catch (const std::exception& e) {
        Logger::logException("unhandled exception (lightcycle)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        Logger::logUnknownException("unhandled exception (lightcycle)");
        Logger::shutdown();
        return 2;
    }
    Logger::shutdown();
    return 0;
}
