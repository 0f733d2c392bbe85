/**
 * @file WeightedAggregator.h
 * @brief Declares WeightedAggregator: fans one job per heuristic out to a WorkerPool and merges the
 *        weighted, normalized results under a timeout.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "Strategy.h"
#include "StrategyJob.h"

class WorkerPool;

/** @brief One heuristic and its positive weight. */
struct WeightedStrategy {
    std::shared_ptr<Strategy> strategy;
    float weight{1.0f};
};

/**
 * @class WeightedAggregator
 * @brief Combined strategy: runs every heuristic in parallel and sums weight × normalized score.
 *
 * State machine per instance: Idle → Running → {Completed | TimedOut} → Idle. Only one calculate()
 * may be in flight per instance; calling it concurrently is a caller bug.
 *
 * A decision returns as soon as every heuristic has reported, or when the timeout elapses,
 * whichever comes first. Reports arriving after that are dropped: each decision is a numbered
 * round and a report only counts for the round it was issued in, while that round is open. A
 * partial result is an intended outcome, not an error.
 */
class WeightedAggregator : public Strategy {
public:
    enum class State { Idle, Running, Completed, TimedOut };

    static constexpr std::chrono::milliseconds DefaultTimeout{1750};

    /**
     * @brief Build one StrategyJob per entry of @p strategies, all scheduled on @p pool.
     * @throws std::invalid_argument on an empty list, a null strategy, a non-positive weight or a null pool.
     */
    WeightedAggregator(const std::vector<WeightedStrategy>& strategies,
                       std::shared_ptr<WorkerPool> pool,
                       std::chrono::milliseconds timeout = DefaultTimeout);
    /** @brief Waits for jobs still running (including late ones) since they refer back to this instance. */
    ~WeightedAggregator() override;

    WeightedAggregator(const WeightedAggregator&) = delete;
    WeightedAggregator& operator=(const WeightedAggregator&) = delete;

    /** @brief Run all heuristics on a snapshot of @p board and return the (possibly partial) merged map. */
    ScoreMap calculate(const Coordinates& position, const Board& board) override;
    const char* name() const override { return "weighted"; }

    /** @brief Merge @p scores from @p job for @p round; dropped if that round is closed or superseded. */
    void reportResult(const StrategyJob& job, std::uint64_t round, const ScoreMap& scores);

    // Observers
    /** @brief Running while a calculate() is waiting, Idle otherwise. */
    State state() const;
    /** @brief Completed or TimedOut for the last finished calculate(); Idle before the first. */
    State lastOutcome() const;
    /** @brief Reports merged into the last finished calculate(). */
    size_t lastContributions() const;
    /** @brief Number of heuristics S. */
    size_t strategyCount() const { return jobs.size(); }
    /** @brief Upper bound on a calculate() wait. */
    std::chrono::milliseconds timeout() const { return maxWait; }
    /** @brief Jobs submitted and not yet finished, across rounds. */
    size_t inFlight() const;

private:
    /** @brief Called after a job has reported; wakes the destructor when the last one ends. */
    void jobFinished();

    std::shared_ptr<WorkerPool> pool;               /**< shared worker threads; outlives the jobs */
    std::vector<std::unique_ptr<StrategyJob>> jobs; /**< index-aligned with the weighted strategies */
    std::chrono::milliseconds maxWait;              /**< bounded wait per decision */

    mutable std::mutex mtx;           /**< protects everything below */
    std::condition_variable resultCv; /**< signalled when pending reaches 0 */
    std::condition_variable idleCv;   /**< signalled when running reaches 0 */
    ScoreMap merged;                  /**< weighted sum for the current round */
    size_t pending{0};                /**< reports still expected in the current round */
    size_t contributions{0};          /**< reports merged in the current round */
    bool timedOut{true};              /**< current round closed; late reports are discarded */
    std::uint64_t currentRound{0};    /**< number of the latest round */
    size_t running{0};                /**< submitted jobs not yet finished */
    State st{State::Idle};
    State outcome{State::Idle};
};
