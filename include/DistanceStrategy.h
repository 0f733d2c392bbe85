/**
 * @file DistanceStrategy.h
 * @brief Ray-cast heuristic: free run length in each direction.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Strategy.h"

/**
 * @class DistanceStrategy
 * @brief Scores each direction by how many free cells lie in a straight line before the first wall.
 *
 * Counting starts one step away from the position and excludes the blocking cell, so on an empty
 * 30×20 board at (15,10) the scores are LEFT 15, UP 10, RIGHT 14, DOWN 9.
 */
class DistanceStrategy : public Strategy {
public:
    ScoreMap calculate(const Coordinates& position, const Board& board) override;
    const char* name() const override { return "distance"; }

    /** @brief Number of consecutive free cells from @p from (exclusive) in direction @p d. */
    static int line(const Board& board, const Coordinates& from, Direction d);
};
