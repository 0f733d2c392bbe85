/**
 * @file Cycle.h
 * @brief Declares the Cycle class: one tracked participant with a position, a trail and a strategy.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Coordinates.h"
#include "Direction.h"

class Board;
class Strategy;

/**
 * @class Cycle
 * @brief One agent on the Board. Cycles are created lazily by Board::cycle and never removed.
 *
 * Responsibilities:
 * - Track the current position and the ordered path of occupied cells
 * - Mark and unmark its trail on the owning Board (touch/destroy)
 * - Pick a direction from its assigned strategy with a deterministic tie-break
 */
class Cycle {
public:
    /** @brief Construct cycle @p id bound to @p board; use Board::cycle rather than calling this directly. */
    Cycle(Board& board, int id);

    // Identity
    /** @brief Protocol player number. */
    int id() const { return number; }
    /** @brief Current position; empty until the first touch. */
    const std::optional<Coordinates>& position() const { return pos; }
    /** @brief Cells occupied so far, oldest first. */
    const std::vector<Coordinates>& path() const { return trail; }

    /** @brief Move to (x,y): set position, append to the path, mark the cell with this cycle's marker. */
    void touch(int x, int y);
    /** @brief Free every cell of the path and empty it; the last position is kept for reference. */
    void destroy();

    // Strategy
    /** @brief Assign the strategy used by choose(); set once per cycle. */
    void setStrategy(std::shared_ptr<Strategy> s) { strategy = std::move(s); }
    /** @brief Tell whether a strategy has been assigned. */
    bool hasStrategy() const { return strategy != nullptr; }
    /** @brief The assigned strategy (may be null). */
    const std::shared_ptr<Strategy>& getStrategy() const { return strategy; }

    /** @brief Score the directions with the assigned strategy and return the best one (see bestDirection). */
    Direction choose();
    /** @brief Direction with the strictly greatest score, scanning kScanOrder (UP, RIGHT, DOWN, LEFT). */
    static Direction bestDirection(const ScoreMap& scores);

    /** @brief "id: X - x, Y - y" for debug logs. */
    std::string dump() const;

private:
    Board& board;                   /**< owning board */
    int number;                     /**< player number */
    std::optional<Coordinates> pos; /**< current position */
    std::vector<Coordinates> trail; /**< previously occupied cells */
    std::shared_ptr<Strategy> strategy; /**< selected strategy */
};
