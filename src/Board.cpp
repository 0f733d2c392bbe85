/**
 * @file Board.cpp
 * @brief Board implementation: bounds-checked cell access, lazy cycle registry, and text dump.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Board.h"
#include "Cycle.h"
#include "Logger.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace {
/** @brief Compute flattened index into grid vector for coordinates (x,y) in a width w grid. */
inline size_t idx(int x, int y, int w) { return static_cast<size_t>(y) * static_cast<size_t>(w) + static_cast<size_t>(x); }

/** @brief Single glyph for a trail marker in dumps. */
char glyphFor(Board::Cell c) {
    if (c == 0) return '.';
    int id = static_cast<int>(c) - 1;
    if (id < 10) return static_cast<char>('0' + id);
    if (id < 36) return static_cast<char>('a' + (id - 10));
    return '#';
}
}

/** @copydoc Board::Board */
Board::Board(int width, int height)
    : w(width), h(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Board: size must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    grid.assign(idx(0, height, width), 0);
}

/** @copydoc Board::clone */
Board Board::clone() const {
    Board copy(w, h);
    copy.grid = grid;
    return copy;
}

/** @copydoc Board::get */
Board::Cell Board::get(int x, int y) const {
    // Failsafe
    if (!inBounds(x, y)) return OutOfRange;
    return grid[idx(x, y, w)];
}

/** @copydoc Board::set */
void Board::set(int x, int y, Cell v) {
    if (!inBounds(x, y)) return;
    grid[idx(x, y, w)] = v;
}

/** @copydoc Board::freeCells */
int Board::freeCells() const {
    return static_cast<int>(std::count(grid.begin(), grid.end(), Cell{0}));
}

/** @copydoc Board::clear */
void Board::clear() {
    std::fill(grid.begin(), grid.end(), Cell{0});
}

/** @copydoc Board::cycle */
std::shared_ptr<Cycle> Board::cycle(int id) {
    if (id < 0 || id >= MaxCycles) {
        throw std::out_of_range("Board::cycle: invalid id " + std::to_string(id));
    }
    auto it = cycles_.find(id);
    if (it != cycles_.end()) return it->second;
    auto c = std::make_shared<Cycle>(*this, id);
    cycles_.emplace(id, c);
    Logger::debug("Board::cycle: registered id=" + std::to_string(id));
    return c;
}

/** @copydoc Board::dump */
std::string Board::dump() const {
    std::ostringstream oss;
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) oss << glyphFor(grid[idx(x, y, w)]);
        oss << '\n';
    }
    return oss.str();
}
