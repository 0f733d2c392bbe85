/**
 * @file Direction.cpp
 * @brief Direction labels/offsets and ScoreMap arithmetic.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Direction.h"

#include <sstream>

const char* toString(Direction d) {
    switch (d) {
        case Direction::Up: return "UP";
        case Direction::Right: return "RIGHT";
        case Direction::Down: return "DOWN";
        case Direction::Left: return "LEFT";
    }
    return "UP";
}

Coordinates offset(Direction d) {
    switch (d) {
        case Direction::Up: return {0, -1};
        case Direction::Right: return {1, 0};
        case Direction::Down: return {0, 1};
        case Direction::Left: return {-1, 0};
    }
    return {0, 0};
}

Coordinates step(const Coordinates& from, Direction d) {
    Coordinates o = offset(d);
    return {from.x + o.x, from.y + o.y};
}

void ScoreMap::normalize() {
    float s = sum();
    // Avoid division by zero
    if (s == 0.0f) return;
    for (auto& x : v) x /= s;
}

void ScoreMap::addWeighted(const ScoreMap& other, float weight) {
    for (size_t i = 0; i < v.size(); ++i) v[i] += weight * other.v[i];
}

std::string ScoreMap::str() const {
    std::ostringstream oss;
    bool first = true;
    for (Direction d : kScanOrder) {
        if (!first) oss << ' ';
        oss << toString(d) << '=' << (*this)[d];
        first = false;
    }
    return oss.str();
}
