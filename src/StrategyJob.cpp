/**
 * @file StrategyJob.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "StrategyJob.h"
#include "Logger.h"
#include "Strategy.h"
#include "WeightedAggregator.h"

#include <exception>
#include <string>

StrategyJob::StrategyJob(WeightedAggregator& owner, std::shared_ptr<Strategy> strategy, float weight, size_t index)
    : parent(owner), wrapped(std::move(strategy)), lambda(weight), slot(index) {}

void StrategyJob::execute(const Coordinates& position, const Board& board, std::uint64_t round) const {
    ScoreMap result;
    try {
        result = wrapped->calculate(position, board);
        result.normalize();
    } catch (const std::exception& e) {
        Logger::logException(std::string("strategy '") + wrapped->name() + "' failed, counting as zero", e);
        result.clear();
    } catch (...) {
        Logger::logUnknownException(std::string("strategy '") + wrapped->name() + "' failed, counting as zero");
        result.clear();
    }
    parent.reportResult(*this, round, result);
}
