/**
 * @file Session.cpp
 * @brief Session implementation: turn ingestion, lazy strategy assignment, and decisions.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Session.h"
#include "Cycle.h"
#include "DistanceStrategy.h"
#include "Logger.h"
#include "SpaceStrategy.h"
#include "WallHugStrategy.h"
#include "WorkerPool.h"

/** @copydoc Session::Session */
Session::Session(const BotConfig& config)
    : cfg(config), workers(makePool(config)), grid(config.width, config.height) {
    Logger::info("session: " + cfg.describe());
}

Session::~Session() {
    Logger::info("session ending after " + std::to_string(decided) + " decisions");
}

/** @copydoc Session::ingestTurn */
void Session::ingestTurn(int cycleId, const std::optional<Coordinates>& previous, const Coordinates& current) {
    auto c = grid.cycle(cycleId);
    if (!previous) {
        if (!c->path().empty()) Logger::info("cycle " + std::to_string(cycleId) + " eliminated");
        c->destroy();
        return;
    }
    // Extension over touching current only: X0 Y0 is the start cell, so record it on first sighting
    if (c->path().empty() && *previous != current) c->touch(previous->x, previous->y);
    c->touch(current.x, current.y);
}

/** @copydoc Session::decide */
Direction Session::decide(int cycleId) {
    auto player = grid.cycle(cycleId);
    if (!player->hasStrategy()) {
        player->setStrategy(makeAggregator(cfg, workers));
        Logger::info("cycle " + std::to_string(cycleId) + " assigned weighted strategy");
    }
    if (Logger::enabled(Logger::Level::Debug)) {
        std::string cycles;
        for (const auto& entry : grid.cycles()) cycles += entry.second->dump() + "\n";
        Logger::debug("turn " + std::to_string(decided + 1) + "\n" + cycles + grid.dump());
    }
    ++decided;
    return player->choose();
}

/** @copydoc Session::strategiesFor */
std::vector<WeightedStrategy> Session::strategiesFor(const BotConfig& config) {
    return {
        {std::make_shared<DistanceStrategy>(), config.distanceWeight},
        {std::make_shared<SpaceStrategy>(config.spaceDepth), config.spaceWeight},
        {std::make_shared<WallHugStrategy>(), config.wallHugWeight},
    };
}

/** @copydoc Session::makeAggregator */
std::shared_ptr<WeightedAggregator> Session::makeAggregator(const BotConfig& config,
                                                            std::shared_ptr<WorkerPool> pool) {
    return std::make_shared<WeightedAggregator>(strategiesFor(config), std::move(pool),
                                                std::chrono::milliseconds(config.timeoutMs));
}

/** @copydoc Session::makePool */
std::shared_ptr<WorkerPool> Session::makePool(const BotConfig& config) {
    size_t n = config.workers > 0 ? static_cast<size_t>(config.workers) : strategiesFor(config).size();
    return std::make_shared<WorkerPool>(n);
}
