/**
 * @file WeightedAggregator.cpp
 * @brief WeightedAggregator implementation: round bookkeeping, fan-out, bounded wait and merge.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "WeightedAggregator.h"
#include "Board.h"
#include "Logger.h"
#include "WorkerPool.h"

#include <cmath>
#include <stdexcept>
#include <string>

/** @copydoc WeightedAggregator::WeightedAggregator */
WeightedAggregator::WeightedAggregator(const std::vector<WeightedStrategy>& strategies,
                                       std::shared_ptr<WorkerPool> workerPool,
                                       std::chrono::milliseconds timeout)
    : pool(std::move(workerPool)), maxWait(timeout) {
    if (!pool) throw std::invalid_argument("WeightedAggregator: null worker pool");
    if (strategies.empty()) throw std::invalid_argument("WeightedAggregator: no strategies");
    if (maxWait.count() < 0) maxWait = std::chrono::milliseconds(0);

    jobs.reserve(strategies.size());
    for (const auto& ws : strategies) {
        if (!ws.strategy) throw std::invalid_argument("WeightedAggregator: null strategy");
        if (!(ws.weight > 0.0f) || !std::isfinite(ws.weight)) {
            throw std::invalid_argument(std::string("WeightedAggregator: weight of '") + ws.strategy->name() +
                                        "' must be positive, got " + std::to_string(ws.weight));
        }
        jobs.push_back(std::make_unique<StrategyJob>(*this, ws.strategy, ws.weight, jobs.size()));
    }
}

/** @copydoc WeightedAggregator::~WeightedAggregator */
WeightedAggregator::~WeightedAggregator() {
    std::unique_lock<std::mutex> lock(mtx);
    timedOut = true;
    if (running > 0) {
        Logger::debug("WeightedAggregator: waiting for " + std::to_string(running) + " late jobs");
        idleCv.wait(lock, [this] { return running == 0; });
    }
}

/** @copydoc WeightedAggregator::calculate */
ScoreMap WeightedAggregator::calculate(const Coordinates& position, const Board& board) {
    using namespace std::chrono;
    // Jobs read a private snapshot so the caller may keep mutating its board after we return
    auto snapshot = std::make_shared<const Board>(board.clone());

    std::uint64_t round;
    {
        std::lock_guard<std::mutex> lock(mtx);
        round = ++currentRound;
        pending = jobs.size();
        contributions = 0;
        merged.clear();
        timedOut = false;
        st = State::Running;
        running += jobs.size();
    }

    const auto start = steady_clock::now();
    for (const auto& job : jobs) {
        const StrategyJob* j = job.get();
        bool accepted = pool->submit([this, j, position, snapshot, round] {
            try {
                j->execute(position, *snapshot, round);
            } catch (...) {
                jobFinished();
                throw;
            }
            jobFinished();
        });
        if (!accepted) {
            Logger::warn(std::string("WeightedAggregator: pool rejected '") + j->strategy().name() +
                         "', counting as zero");
            reportResult(*j, round, ScoreMap{});
            jobFinished();
        }
    }

    std::unique_lock<std::mutex> lock(mtx);
    const bool complete = resultCv.wait_for(lock, maxWait, [this] { return pending == 0; });
    // Close the round; anything still running reports into the void
    timedOut = true;
    outcome = complete ? State::Completed : State::TimedOut;
    st = State::Idle;
    ScoreMap result = merged;
    const size_t got = contributions;
    lock.unlock();

    const auto elapsedMs = duration_cast<milliseconds>(steady_clock::now() - start).count();
    if (complete) {
        Logger::debug("round " + std::to_string(round) + " complete in " + std::to_string(elapsedMs) + "ms: " +
                      result.str());
    } else {
        Logger::warn("round " + std::to_string(round) + " timed out after " + std::to_string(elapsedMs) + "ms with " +
                     std::to_string(got) + "/" + std::to_string(jobs.size()) + " results");
    }
    return result;
}

/** @copydoc WeightedAggregator::reportResult */
void WeightedAggregator::reportResult(const StrategyJob& job, std::uint64_t round, const ScoreMap& scores) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!timedOut && round == currentRound) {
            merged.addWeighted(scores, job.weight());
            ++contributions;
            if (--pending == 0) resultCv.notify_all();
            return;
        }
    }
    Logger::debug(std::string("dropping late result of '") + job.strategy().name() + "' (job " +
                  std::to_string(job.index()) + ") from round " + std::to_string(round));
}

/** @copydoc WeightedAggregator::jobFinished */
void WeightedAggregator::jobFinished() {
    std::lock_guard<std::mutex> lock(mtx);
    if (--running == 0) idleCv.notify_all();
}

/** @copydoc WeightedAggregator::state */
WeightedAggregator::State WeightedAggregator::state() const {
    std::lock_guard<std::mutex> lock(mtx);
    return st;
}

/** @copydoc WeightedAggregator::lastOutcome */
WeightedAggregator::State WeightedAggregator::lastOutcome() const {
    std::lock_guard<std::mutex> lock(mtx);
    return outcome;
}

/** @copydoc WeightedAggregator::lastContributions */
size_t WeightedAggregator::lastContributions() const {
    std::lock_guard<std::mutex> lock(mtx);
    return contributions;
}

/** @copydoc WeightedAggregator::inFlight */
size_t WeightedAggregator::inFlight() const {
    std::lock_guard<std::mutex> lock(mtx);
    return running;
}
