/**
 * @file WallHugStrategy.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "WallHugStrategy.h"
#include "Board.h"

namespace {
inline bool blocked(const Board& b, int x, int y) { return b.get(x, y) > 0; }
}

ScoreMap WallHugStrategy::calculate(const Coordinates& position, const Board& board) {
    const int x = position.x;
    const int y = position.y;
    int left = 1, right = 1, up = 1, down = 1;

    if (blocked(board, x + 1, y - 1)) { right++; up++; }   // top right
    if (blocked(board, x + 1, y + 1)) { right++; down++; } // bottom right
    if (blocked(board, x - 1, y + 1)) { left++; down++; }  // bottom left
    if (blocked(board, x - 1, y - 1)) { left++; up++; }    // top left

    // Flag dangerous routes
    up = (up == 3 ? 1 : up);
    right = (right == 3 ? 1 : right);
    down = (down == 3 ? 1 : down);
    left = (left == 3 ? 1 : left);

    // Delete suicide routes
    if (blocked(board, x, y - 1)) up = 0;
    if (blocked(board, x + 1, y)) right = 0;
    if (blocked(board, x, y + 1)) down = 0;
    if (blocked(board, x - 1, y)) left = 0;

    return ScoreMap(static_cast<float>(up), static_cast<float>(right),
                    static_cast<float>(down), static_cast<float>(left));
}
