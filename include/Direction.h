/**
 * @file Direction.h
 * @brief The four move directions, their grid offsets, and the per-direction ScoreMap.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <array>
#include <cstddef>
#include <string>

#include "Coordinates.h"

/** @brief Move direction; up is y-1, down is y+1. */
enum class Direction { Up = 0, Right = 1, Down = 2, Left = 3 };

/** @brief Selection scan order; the first direction in this order wins ties. */
constexpr std::array<Direction, 4> kScanOrder{Direction::Up, Direction::Right, Direction::Down, Direction::Left};

/** @brief Protocol label ("UP", "RIGHT", "DOWN", "LEFT"). */
const char* toString(Direction d);
/** @brief Unit offset of @p d. */
Coordinates offset(Direction d);
/** @brief The cell one step from @p from in direction @p d. */
Coordinates step(const Coordinates& from, Direction d);

/**
 * @class ScoreMap
 * @brief One real score per direction. Directions never assigned read as 0.
 */
class ScoreMap {
public:
    ScoreMap() = default;
    ScoreMap(float up, float right, float down, float left) : v{up, right, down, left} {}

    float& operator[](Direction d) { return v[static_cast<size_t>(d)]; }
    float operator[](Direction d) const { return v[static_cast<size_t>(d)]; }

    /** @brief Sum of all four scores. */
    float sum() const { return v[0] + v[1] + v[2] + v[3]; }
    /** @brief Scale to sum 1; a map summing to exactly 0 is left unchanged. */
    void normalize();
    /** @brief this[d] += weight * other[d] for every direction. */
    void addWeighted(const ScoreMap& other, float weight);
    /** @brief Reset all scores to 0. */
    void clear() { v.fill(0.0f); }

    bool operator==(const ScoreMap& o) const { return v == o.v; }

    /** @brief "UP=.. RIGHT=.. DOWN=.. LEFT=.." for log lines. */
    std::string str() const;

private:
    std::array<float, 4> v{};
};
