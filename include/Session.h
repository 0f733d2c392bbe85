/**
 * @file Session.h
 * @brief Declares Session: the per-process context that ingests turns and produces decisions.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "Board.h"
#include "Config.h"
#include "Coordinates.h"
#include "Direction.h"
#include "WeightedAggregator.h"

class WorkerPool;

/**
 * @class Session
 * @brief Owns the authoritative Board, the WorkerPool and the decision strategy for a whole game.
 *
 * One Session is created at startup and fed every turn; nothing here is global.
 */
class Session {
public:
    /** @brief Create the board and worker pool described by @p config. */
    explicit Session(const BotConfig& config);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Record one player's line of the turn input.
     *
     * An absent @p previous means the player is eliminated and its trail is freed. Otherwise
     * @p current is touched; on the first sighting the start cell @p previous is touched first
     * when it differs, so trails of players that moved before us are complete.
     */
    void ingestTurn(int cycleId, const std::optional<Coordinates>& previous, const Coordinates& current);
    /** @brief Choose the move for @p cycleId, assigning the weighted strategy on first use. */
    Direction decide(int cycleId);

    /** @brief Authoritative board. */
    Board& board() { return grid; }
    const Board& board() const { return grid; }
    const BotConfig& config() const { return cfg; }
    /** @brief Decisions made so far. */
    int decisions() const { return decided; }

    /** @brief Heuristics and weights described by @p config (distance, space, wall-hug). */
    static std::vector<WeightedStrategy> strategiesFor(const BotConfig& config);
    /** @brief A WeightedAggregator over strategiesFor(@p config), scheduled on @p pool. */
    static std::shared_ptr<WeightedAggregator> makeAggregator(const BotConfig& config,
                                                              std::shared_ptr<WorkerPool> pool);
    /** @brief Worker pool sized by config.workers (0 = one per heuristic). */
    static std::shared_ptr<WorkerPool> makePool(const BotConfig& config);

private:
    BotConfig cfg;
    std::shared_ptr<WorkerPool> workers; /**< declared before grid; the aggregators' destructors wait for their jobs before it goes */
    Board grid;
    int decided{0};
};
