/**
 * @file SpaceStrategy.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SpaceStrategy.h"
#include "Board.h"

#include <algorithm>

namespace {
/** @brief Scratch-only marker for filled cells; never written to a shared board. */
constexpr Board::Cell Visited = Board::OutOfRange - 1;

constexpr Direction kFillOrder[4]{Direction::Left, Direction::Up, Direction::Right, Direction::Down};
}

SpaceStrategy::SpaceStrategy(int depth)
    : maxDepth(std::max(1, depth)) {}

ScoreMap SpaceStrategy::calculate(const Coordinates& position, const Board& board) {
    Board scratch = board.clone();
    ScoreMap spaces;
    for (Direction d : kFillOrder) {
        Coordinates n = step(position, d);
        spaces[d] = static_cast<float>(space(scratch, n.x, n.y, maxDepth));
    }
    return spaces;
}

int SpaceStrategy::space(Board& scratch, int x, int y, int s) {
    if (s <= 0 || !scratch.inBounds(x, y)) return 0;
    if (scratch.get(x, y) != 0) return 0;

    scratch.set(x, y, Visited);
    int i = 1;
    i += space(scratch, x + 1, y, s - 1);
    i += space(scratch, x - 1, y, s - 1);
    i += space(scratch, x, y + 1, s - 1);
    i += space(scratch, x, y - 1, s - 1);
    return i;
}
