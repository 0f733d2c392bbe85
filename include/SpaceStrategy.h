/**
 * @file SpaceStrategy.h
 * @brief Flood-fill heuristic: reachable free area behind each neighbor, bounded by search depth.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Strategy.h"

/**
 * @class SpaceStrategy
 * @brief Scores each direction by the free area a depth-bounded flood fill reaches from that neighbor.
 *
 * The board is cloned once per call and filled cells are marked on the clone, so a region is
 * credited only to the first direction that reaches it. Directions are explored LEFT, UP, RIGHT,
 * DOWN. The input board is never modified.
 */
class SpaceStrategy : public Strategy {
public:
    /** @brief Default maximum path length explored from each neighbor. */
    static constexpr int DefaultDepth = 12;

    /** @brief Create with the flood-fill depth bound (values below 1 are raised to 1). */
    explicit SpaceStrategy(int depth = DefaultDepth);

    ScoreMap calculate(const Coordinates& position, const Board& board) override;
    const char* name() const override { return "space"; }

    int depth() const { return maxDepth; }

private:
    /** @brief Count free cells reachable from (x,y) within @p s steps, marking them on @p scratch. */
    static int space(Board& scratch, int x, int y, int s);

    int maxDepth;
};
