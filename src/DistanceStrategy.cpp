/**
 * @file DistanceStrategy.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "DistanceStrategy.h"
#include "Board.h"

ScoreMap DistanceStrategy::calculate(const Coordinates& position, const Board& board) {
    ScoreMap directions;
    for (Direction d : kScanOrder) directions[d] = static_cast<float>(line(board, position, d));
    return directions;
}

int DistanceStrategy::line(const Board& board, const Coordinates& from, Direction d) {
    const Coordinates o = offset(d);
    int x = from.x + o.x;
    int y = from.y + o.y;
    int i = 0;
    while (board.inBounds(x, y) && board.get(x, y) == 0) {
        x += o.x;
        y += o.y;
        ++i;
    }
    return i;
}
