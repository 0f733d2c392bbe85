// tests/test_weighted_aggregator.cpp (doctest)
#include <doctest/doctest.h>

#include "Board.h"
#include "Cycle.h"
#include "WeightedAggregator.h"
#include "WorkerPool.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace lightcycle_test_aggregator {

class Fixed final : public Strategy {
public:
    explicit Fixed(ScoreMap s) : scores(s) {}
    ScoreMap calculate(const Coordinates&, const Board&) override { return scores; }
    const char* name() const override { return "fixed"; }

private:
    ScoreMap scores;
};

class Throwing final : public Strategy {
public:
    ScoreMap calculate(const Coordinates&, const Board&) override { throw std::runtime_error("heuristic failed"); }
    const char* name() const override { return "throwing"; }
};

/** @brief Sleeps for a fixed time before answering. */
class Sleeper final : public Strategy {
public:
    Sleeper(std::chrono::milliseconds d, ScoreMap s) : delay(d), scores(s) {}
    ScoreMap calculate(const Coordinates&, const Board&) override {
        std::this_thread::sleep_for(delay);
        finished = true;
        return scores;
    }
    const char* name() const override { return "sleeper"; }
    std::atomic<bool> finished{false};

private:
    std::chrono::milliseconds delay;
    ScoreMap scores;
};

/** @brief Shared latch between the slow and the gated strategy of the timeout scenario. */
struct Latch {
    std::mutex m;
    std::condition_variable cv;
    bool open{false};
    void release() {
        std::lock_guard<std::mutex> lock(m);
        open = true;
        cv.notify_all();
    }
    bool waitFor(std::chrono::milliseconds limit) {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, limit, [this] { return open; });
    }
};

/** @brief First call outlives the decision budget and answers UP; later calls answer DOWN at once. */
class SlowFirst final : public Strategy {
public:
    explicit SlowFirst(Latch& l) : latch(l) {}
    ScoreMap calculate(const Coordinates&, const Board&) override {
        if (calls.fetch_add(1) == 0) {
            std::this_thread::sleep_for(1500ms);
            latch.release();
            return ScoreMap(1, 0, 0, 0);
        }
        return ScoreMap(0, 0, 1, 0);
    }
    const char* name() const override { return "slow-first"; }

private:
    Latch& latch;
    std::atomic<int> calls{0};
};

/** @brief Always answers RIGHT; on its second call it only answers after the slow job's first call has returned. */
class Gated final : public Strategy {
public:
    explicit Gated(Latch& l) : latch(l) {}
    ScoreMap calculate(const Coordinates&, const Board&) override {
        if (calls.fetch_add(1) == 1) {
            latch.waitFor(5s);
            std::this_thread::sleep_for(50ms);
        }
        return ScoreMap(0, 1, 0, 0);
    }
    const char* name() const override { return "gated"; }

private:
    Latch& latch;
    std::atomic<int> calls{0};
};

} // namespace lightcycle_test_aggregator

using namespace lightcycle_test_aggregator;

TEST_CASE("aggregator: weighted sum of normalized maps") {
    auto pool = std::make_shared<WorkerPool>(2);
    WeightedAggregator agg({{std::make_shared<Fixed>(ScoreMap(1, 1, 1, 1)), 1.0f},
                            {std::make_shared<Fixed>(ScoreMap(2, 0, 0, 0)), 2.0f}},
                           pool, 5000ms);
    Board b(5, 5);
    ScoreMap s = agg.calculate(Coordinates(2, 2), b);
    CHECK(s[Direction::Up] == doctest::Approx(2.25f));
    CHECK(s[Direction::Right] == doctest::Approx(0.25f));
    CHECK(s[Direction::Down] == doctest::Approx(0.25f));
    CHECK(s[Direction::Left] == doctest::Approx(0.25f));
    CHECK(agg.lastOutcome() == WeightedAggregator::State::Completed);
    CHECK(agg.lastContributions() == 2);
    CHECK(agg.state() == WeightedAggregator::State::Idle);
    CHECK(agg.strategyCount() == 2);
}

TEST_CASE("aggregator: an all-zero map contributes nothing") {
    auto pool = std::make_shared<WorkerPool>(2);
    WeightedAggregator agg({{std::make_shared<Fixed>(ScoreMap(0, 0, 0, 0)), 3.0f},
                            {std::make_shared<Fixed>(ScoreMap(0, 0, 4, 0)), 1.0f}},
                           pool, 5000ms);
    Board b(5, 5);
    ScoreMap s = agg.calculate(Coordinates(2, 2), b);
    CHECK(s == ScoreMap(0, 0, 1, 0));
}

TEST_CASE("aggregator: returns as soon as every job has reported") {
    auto pool = std::make_shared<WorkerPool>(3);
    WeightedAggregator agg({{std::make_shared<Fixed>(ScoreMap(1, 0, 0, 0)), 1.0f},
                            {std::make_shared<Fixed>(ScoreMap(0, 1, 0, 0)), 1.0f},
                            {std::make_shared<Fixed>(ScoreMap(0, 0, 1, 0)), 1.0f}},
                           pool, 5000ms);
    Board b(5, 5);
    const auto start = std::chrono::steady_clock::now();
    agg.calculate(Coordinates(0, 0), b);
    CHECK(std::chrono::steady_clock::now() - start < 1000ms);
    CHECK(agg.lastOutcome() == WeightedAggregator::State::Completed);
}

TEST_CASE("aggregator: a failing heuristic counts as zero") {
    auto pool = std::make_shared<WorkerPool>(2);
    WeightedAggregator agg({{std::make_shared<Throwing>(), 5.0f},
                            {std::make_shared<Fixed>(ScoreMap(0, 0, 0, 2)), 1.0f}},
                           pool, 5000ms);
    Board b(5, 5);
    ScoreMap s = agg.calculate(Coordinates(2, 2), b);
    CHECK(s == ScoreMap(0, 0, 0, 1));
    CHECK(agg.lastOutcome() == WeightedAggregator::State::Completed);
    CHECK(agg.lastContributions() == 2);
}

TEST_CASE("aggregator: timeout returns partial result and drops the late report") {
    Latch latch;
    auto pool = std::make_shared<WorkerPool>(4);
    WeightedAggregator agg({{std::make_shared<SlowFirst>(latch), 1.0f},
                            {std::make_shared<Gated>(latch), 2.0f},
                            {std::make_shared<Fixed>(ScoreMap(0, 0, 0, 1)), 4.0f}},
                           pool, 1000ms);
    Board b(10, 10);

    const auto start = std::chrono::steady_clock::now();
    ScoreMap first = agg.calculate(Coordinates(5, 5), b);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    CHECK(elapsed >= 900ms);
    CHECK(elapsed < 1450ms);
    CHECK(first == ScoreMap(0, 2, 0, 4));
    CHECK(agg.lastOutcome() == WeightedAggregator::State::TimedOut);
    CHECK(agg.lastContributions() == 2);

    // The slow job's UP arrives while this round is open and must not leak into it
    ScoreMap second = agg.calculate(Coordinates(5, 5), b);
    CHECK(second == ScoreMap(0, 2, 1, 4));
    CHECK(agg.lastOutcome() == WeightedAggregator::State::Completed);
    CHECK(agg.lastContributions() == 3);
}

TEST_CASE("aggregator: destruction waits for jobs still running") {
    auto pool = std::make_shared<WorkerPool>(1);
    auto slow = std::make_shared<Sleeper>(300ms, ScoreMap(1, 0, 0, 0));
    {
        WeightedAggregator agg({{slow, 1.0f}}, pool, 10ms);
        Board b(3, 3);
        ScoreMap s = agg.calculate(Coordinates(1, 1), b);
        CHECK(s == ScoreMap());
        CHECK(agg.lastOutcome() == WeightedAggregator::State::TimedOut);
        CHECK(agg.inFlight() == 1);
    }
    CHECK(slow->finished.load());
}

TEST_CASE("aggregator: board and pool go away on the owner thread while a late job runs") {
    auto slow = std::make_shared<Sleeper>(300ms, ScoreMap(1, 0, 0, 0));
    auto pool = std::make_shared<WorkerPool>(1);
    std::weak_ptr<WorkerPool> watch = pool;
    {
        Board b(5, 5);
        auto c = b.cycle(0);
        c->touch(2, 2);
        c->setStrategy(std::make_shared<WeightedAggregator>(std::vector<WeightedStrategy>{{slow, 1.0f}}, pool, 20ms));
        CHECK(c->choose() == Direction::Up);
        CHECK_FALSE(slow->finished.load());
        pool.reset();
        CHECK_FALSE(watch.expired());
    }
    // Leaving the scope waited for the job and released the pool here, not on its worker
    CHECK(slow->finished.load());
    CHECK(watch.expired());
    std::this_thread::sleep_for(100ms);
}

TEST_CASE("aggregator: a stopped pool yields an all-zero map immediately") {
    auto pool = std::make_shared<WorkerPool>(1);
    pool->shutdown();
    WeightedAggregator agg({{std::make_shared<Fixed>(ScoreMap(1, 0, 0, 0)), 1.0f}}, pool, 5000ms);
    Board b(3, 3);
    const auto start = std::chrono::steady_clock::now();
    CHECK(agg.calculate(Coordinates(1, 1), b) == ScoreMap());
    CHECK(std::chrono::steady_clock::now() - start < 1000ms);
    CHECK(agg.lastOutcome() == WeightedAggregator::State::Completed);
}

TEST_CASE("aggregator: constructor rejects bad input") {
    auto pool = std::make_shared<WorkerPool>(1);
    auto fixed = std::make_shared<Fixed>(ScoreMap(1, 0, 0, 0));
    CHECK_THROWS_AS(WeightedAggregator({{fixed, 1.0f}}, nullptr), std::invalid_argument);
    CHECK_THROWS_AS(WeightedAggregator({}, pool), std::invalid_argument);
    CHECK_THROWS_AS(WeightedAggregator({{nullptr, 1.0f}}, pool), std::invalid_argument);
    CHECK_THROWS_AS(WeightedAggregator({{fixed, 0.0f}}, pool), std::invalid_argument);
    CHECK_THROWS_AS(WeightedAggregator({{fixed, -1.0f}}, pool), std::invalid_argument);
    CHECK(WeightedAggregator({{fixed, 1.0f}}, pool).timeout() == WeightedAggregator::DefaultTimeout);
}
