// tests/test_strategies.cpp (doctest)
#include <doctest/doctest.h>

#include "Board.h"
#include "Cycle.h"
#include "DistanceStrategy.h"
#include "SpaceStrategy.h"
#include "WallHugStrategy.h"

TEST_CASE("distance: empty 30x20 board from (15,10)") {
    Board b(30, 20);
    DistanceStrategy s;
    ScoreMap r = s.calculate(Coordinates(15, 10), b);
    // Cells strictly between the position and the edge
    CHECK(r[Direction::Left] == 15.0f);  // x = 14..0
    CHECK(r[Direction::Up] == 10.0f);    // y = 9..0
    CHECK(r[Direction::Right] == 14.0f); // x = 16..29
    CHECK(r[Direction::Down] == 9.0f);   // y = 11..19
}

TEST_CASE("distance: rays stop before the first occupied cell") {
    Board b(30, 20);
    b.cycle(1)->touch(18, 10);
    b.cycle(1)->touch(15, 4);
    DistanceStrategy s;
    ScoreMap r = s.calculate(Coordinates(15, 10), b);
    CHECK(r[Direction::Right] == 2.0f);
    CHECK(r[Direction::Up] == 5.0f);
    CHECK(r[Direction::Left] == 15.0f);

    CHECK(DistanceStrategy::line(b, Coordinates(0, 0), Direction::Left) == 0);
    CHECK(DistanceStrategy::line(b, Coordinates(0, 0), Direction::Up) == 0);
    CHECK(DistanceStrategy::line(b, Coordinates(17, 10), Direction::Right) == 0);
}

TEST_CASE("space: input board is left bit-identical") {
    Board b(12, 9);
    auto c = b.cycle(0);
    for (int x = 2; x < 9; ++x) c->touch(x, 4);
    b.cycle(1)->touch(5, 1);
    const Board before = b.clone();

    SpaceStrategy s(50);
    s.calculate(*c->position(), b);
    CHECK(b.sameCells(before));
    SpaceStrategy(3).calculate(Coordinates(0, 0), b);
    CHECK(b.sameCells(before));
}

TEST_CASE("space: 5x5 board split by a wall counts each side") {
    Board b(5, 5);
    auto c = b.cycle(0);
    // Column x=2 fully occupied, cycle standing in the middle of it
    c->touch(2, 0);
    c->touch(2, 1);
    c->touch(2, 4);
    c->touch(2, 3);
    c->touch(2, 2);

    SpaceStrategy s(50);
    ScoreMap r = s.calculate(Coordinates(2, 2), b);
    CHECK(r[Direction::Left] == 10.0f);
    CHECK(r[Direction::Right] == 10.0f);
    CHECK(r[Direction::Up] == 0.0f);
    CHECK(r[Direction::Down] == 0.0f);
}

TEST_CASE("space: an open region is credited to the first direction explored") {
    Board b(5, 5);
    b.cycle(0)->touch(2, 2);

    SpaceStrategy s(50);
    ScoreMap r = s.calculate(Coordinates(2, 2), b);
    CHECK(r[Direction::Left] == 24.0f);
    CHECK(r[Direction::Up] == 0.0f);
    CHECK(r[Direction::Right] == 0.0f);
    CHECK(r[Direction::Down] == 0.0f);
}

TEST_CASE("space: depth bound caps the explored path length") {
    Board corridor(30, 1);
    corridor.cycle(0)->touch(0, 0);

    CHECK(SpaceStrategy(3).calculate(Coordinates(0, 0), corridor)[Direction::Right] == 3.0f);
    CHECK(SpaceStrategy().calculate(Coordinates(0, 0), corridor)[Direction::Right] ==
          static_cast<float>(SpaceStrategy::DefaultDepth));
    CHECK(SpaceStrategy(100).calculate(Coordinates(0, 0), corridor)[Direction::Right] == 29.0f);
    CHECK(SpaceStrategy(0).depth() == 1);
}

TEST_CASE("wallhug: open surroundings score 1 everywhere") {
    Board b(9, 9);
    WallHugStrategy s;
    CHECK(s.calculate(Coordinates(4, 4), b) == ScoreMap(1, 1, 1, 1));
}

TEST_CASE("wallhug: occupied diagonals boost their adjacent directions") {
    Board b(9, 9);
    WallHugStrategy s;
    b.set(5, 3, 1); // top right
    CHECK(s.calculate(Coordinates(4, 4), b) == ScoreMap(2, 2, 1, 1));

    b.set(3, 3, 1); // and top left: up reaches 3 and is flagged back to 1
    CHECK(s.calculate(Coordinates(4, 4), b) == ScoreMap(1, 2, 1, 2));
}

TEST_CASE("wallhug: off-board counts as occupied") {
    Board b(9, 9);
    WallHugStrategy s;
    // Corner: up/left are off-board, three diagonals are off-board
    CHECK(s.calculate(Coordinates(0, 0), b) == ScoreMap(0, 2, 2, 0));
}

TEST_CASE("wallhug: occupied destinations are always zero") {
    const int dx[8] = {0, 1, 0, -1, 1, 1, -1, -1};
    const int dy[8] = {-1, 0, 1, 0, -1, 1, 1, -1};
    const Direction orth[4] = {Direction::Up, Direction::Right, Direction::Down, Direction::Left};
    WallHugStrategy s;

    for (int mask = 0; mask < 256; ++mask) {
        Board b(5, 5);
        for (int i = 0; i < 8; ++i) {
            if (mask & (1 << i)) b.set(2 + dx[i], 2 + dy[i], 1);
        }
        ScoreMap r = s.calculate(Coordinates(2, 2), b);
        for (int i = 0; i < 4; ++i) {
            CAPTURE(mask);
            CAPTURE(i);
            if (mask & (1 << i)) CHECK(r[orth[i]] == 0.0f);
            else CHECK(r[orth[i]] >= 1.0f);
        }
    }
}
