/**
 * @file Cycle.cpp
 * @brief Cycle implementation: trail bookkeeping and direction selection.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Cycle.h"
#include "Board.h"
#include "Logger.h"
#include "Strategy.h"

/** @copydoc Cycle::Cycle */
Cycle::Cycle(Board& b, int id)
    : board(b), number(id) {}

/** @copydoc Cycle::touch */
void Cycle::touch(int x, int y) {
    pos.emplace(x, y);
    trail.push_back(*pos);
    board.set(x, y, Board::markerFor(number));
}

/** @copydoc Cycle::destroy */
void Cycle::destroy() {
    if (trail.empty()) return;
    for (const auto& c : trail) board.set(c.x, c.y, 0);
    Logger::debug("cycle " + std::to_string(number) + " destroyed, freed " + std::to_string(trail.size()) + " cells");
    trail.clear();
}

/** @copydoc Cycle::choose */
Direction Cycle::choose() {
    if (!strategy || !pos) {
        Logger::warn("cycle " + std::to_string(number) + ": choose() without " +
                     (strategy ? "position" : "strategy") + ", defaulting to UP");
        return Direction::Up;
    }
    ScoreMap values = strategy->calculate(*pos, board);
    Direction d = bestDirection(values);
    if (Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("cycle " + std::to_string(number) + " at " + pos->str() + ": " + values.str() +
                      " -> " + toString(d));
    }
    return d;
}

/** @copydoc Cycle::bestDirection */
Direction Cycle::bestDirection(const ScoreMap& scores) {
    // Select the direction with the maximal value; earlier in scan order wins ties
    Direction best = kScanOrder[0];
    float value = scores[best];
    for (size_t i = 1; i < kScanOrder.size(); ++i) {
        Direction d = kScanOrder[i];
        if (scores[d] > value) {
            best = d;
            value = scores[d];
        }
    }
    return best;
}

/** @copydoc Cycle::dump */
std::string Cycle::dump() const {
    if (!pos) return std::to_string(number) + ": no position";
    return std::to_string(number) + ": X - " + std::to_string(pos->x) + ", Y - " + std::to_string(pos->y);
}
