/**
 * @file Board.h
 * @brief Declares the Board class which owns the occupancy grid and the registry of cycles.
 *
 * The Board is the authoritative map of free and trail-occupied cells. It is not synchronized:
 * it is mutated only by the thread that ingests turns, and worker threads read immutable clones.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

class Cycle;

/**
 * @class Board
 * @brief W×H occupancy grid plus a lazily populated id → Cycle registry.
 *
 * Cell values:
 * - 0: free
 * - k (1 <= k <= MaxCycles): trail of cycle k-1
 * - OutOfRange: returned by get() for any coordinate off the grid
 *
 * Cycles keep a reference to the Board that created them, so a Board holding cycles must not be
 * moved. Clones carry cells only, so a snapshot handed to a worker never keeps a cycle (and its
 * strategy) alive.
 */
class Board {
public:
    using Cell = std::uint16_t;

    /** @brief Value read for any coordinate outside [0,W)×[0,H). */
    static constexpr Cell OutOfRange = 0xFFFF;
    /** @brief Largest number of distinct cycle ids; markers 1..MaxCycles never collide with the reserved top values. */
    static constexpr int MaxCycles = 0xFF00;

    /** @brief Construct an all-free board; throws std::invalid_argument unless both sizes are positive. */
    Board(int width, int height);

    // Grid helpers
    /** @brief Grid width in cells. */
    int width() const { return w; }
    /** @brief Grid height in cells. */
    int height() const { return h; }
    /** @brief Check if coordinates are within the grid. */
    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < w && y < h; }

    /** @brief Cell value at (x,y), or OutOfRange when off the grid. */
    Cell get(int x, int y) const;
    /** @brief Store @p v at (x,y); silently ignored when off the grid. */
    void set(int x, int y, Cell v);
    /** @brief Whether (x,y) is on the grid and free. */
    bool isFree(int x, int y) const { return get(x, y) == 0; }
    /** @brief Number of free cells. */
    int freeCells() const;
    /** @brief Free every cell (registry entries are kept; their paths are not touched). */
    void clear();

    /** @brief Independent copy of the cells with an empty cycle registry. */
    Board clone() const;
    /** @brief Whether two boards hold identical cells (registry ignored). */
    bool sameCells(const Board& other) const { return w == other.w && h == other.h && grid == other.grid; }

    // Registry
    /** @brief Get or lazily create the cycle with @p id; throws std::out_of_range unless 0 <= id < MaxCycles. */
    std::shared_ptr<Cycle> cycle(int id);
    /** @brief Whether a cycle with @p id has been registered. */
    bool hasCycle(int id) const { return cycles_.count(id) != 0; }
    /** @brief Registered cycles in id order. */
    const std::map<int, std::shared_ptr<Cycle>>& cycles() const { return cycles_; }

    /** @brief Trail marker written for cycle @p id. */
    static Cell markerFor(int id) { return static_cast<Cell>(id + 1); }

    /** @brief Multi-line text rendering: one row per line, '.' free, cycle id digit/letter for trails. */
    std::string dump() const;

private:
    int w, h; /**< grid dimensions */
    std::vector<Cell> grid; /**< flattened grid storage of size w*h, row-major */
    std::map<int, std::shared_ptr<Cycle>> cycles_; /**< registry, never shrinks */
};
