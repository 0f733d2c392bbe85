/**
 * @file Coordinates.h
 * @brief Immutable integer cell position on the Board.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <string>

/**
 * @struct Coordinates
 * @brief An (x,y) cell position; x grows to the right, y grows downward.
 */
struct Coordinates {
    int x{0};
    int y{0};

    constexpr Coordinates() = default;
    constexpr Coordinates(int x0, int y0) : x(x0), y(y0) {}

    bool operator==(const Coordinates& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Coordinates& o) const { return !(*this == o); }

    /** @brief "(x,y)" for log lines. */
    std::string str() const { return "(" + std::to_string(x) + "," + std::to_string(y) + ")"; }
};
