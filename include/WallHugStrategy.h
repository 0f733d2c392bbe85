/**
 * @file WallHugStrategy.h
 * @brief Local heuristic favoring moves that keep a wall or trail alongside.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Strategy.h"

/**
 * @class WallHugStrategy
 * @brief Looks only at the 8-neighborhood.
 *
 * Rules, applied in order:
 * - every direction starts at 1
 * - each occupied diagonal (off-board counts as occupied) adds 1 to its two adjacent directions
 * - a direction boosted to 3 is in a near-enclosed pocket and is reset to 1
 * - a direction whose destination cell is occupied or off-board is 0, overriding everything above
 */
class WallHugStrategy : public Strategy {
public:
    ScoreMap calculate(const Coordinates& position, const Board& board) override;
    const char* name() const override { return "wallhug"; }
};
