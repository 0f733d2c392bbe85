/**
 * @file StrategyJob.h
 * @brief Declares StrategyJob: the schedulable wrapper binding one heuristic, its weight and its aggregator.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "Coordinates.h"
#include "Direction.h"

class Board;
class Strategy;
class WeightedAggregator;

/**
 * @class StrategyJob
 * @brief Runs one heuristic on a worker thread, normalizes its scores and reports them.
 *
 * Jobs are created 1:1 with the weighted strategies when the aggregator is built and keep their
 * identity for its whole lifetime; the per-decision context (position, board snapshot, round) is
 * passed to execute() rather than stored, so a late job can never observe a newer decision.
 */
class StrategyJob {
public:
    StrategyJob(WeightedAggregator& owner, std::shared_ptr<Strategy> strategy, float weight, size_t index);

    /**
     * @brief Calculate, normalize to sum 1 (zero sums untouched) and report for @p round.
     *
     * A heuristic that throws is logged and reported as an all-zero map, so the aggregator is
     * never left waiting on it.
     */
    void execute(const Coordinates& position, const Board& board, std::uint64_t round) const;

    /** @brief Weight applied to this heuristic's normalized scores. */
    float weight() const { return lambda; }
    /** @brief Position in the aggregator's strategy list. */
    size_t index() const { return slot; }
    /** @brief The wrapped heuristic. */
    Strategy& strategy() const { return *wrapped; }

private:
    WeightedAggregator& parent;        /**< receives the report */
    std::shared_ptr<Strategy> wrapped; /**< heuristic being run */
    float lambda;                      /**< weight */
    size_t slot;                       /**< index in the aggregator */
};
