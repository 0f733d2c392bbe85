/**
 * @file Strategy.h
 * @brief Declares the Strategy interface: a scoring function over (position, board).
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Coordinates.h"
#include "Direction.h"

class Board;

/**
 * @class Strategy
 * @brief Scores the four directions for a cycle standing at a position.
 *
 * Heuristics are stateless and may be called concurrently from several worker threads;
 * they must treat the board as read-only. The WeightedAggregator also implements this
 * interface so that a Cycle holds a single strategy.
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    /** @brief Per-direction scores for a cycle at @p position; scores need not be normalized. */
    virtual ScoreMap calculate(const Coordinates& position, const Board& board) = 0;
    /** @brief Short name used in log lines. */
    virtual const char* name() const = 0;
};
