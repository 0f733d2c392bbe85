/**
 * @file Arena.h
 * @brief Declares the Arena class: a local match between several bots on one Board, with ncurses rendering.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#include <ncurses.h>

#include <memory>
#include <random>
#include <string>
#include <vector>

#include "Board.h"
#include "Config.h"
#include "Coordinates.h"

class WorkerPool;

/**
 * @class Arena
 * @brief Runs a light-cycle match locally: every player is a bot with its own weighted strategy.
 *
 * Rules per turn, players in id order:
 * - the player picks a direction with its strategy
 * - moving into an occupied or off-board cell eliminates it and frees its trail
 * - otherwise the destination becomes the head of its trail
 *
 * The match is over when at most one player is left (none for a solo match) or after W×H turns.
 * Rendering is incremental when a window is attached; the Arena itself is single-threaded and
 * only the strategies' heuristics run on the worker pool.
 */
class Arena {
public:
    /** @brief Create the board, pool and players described by @p config and start the first match. */
    explicit Arena(const BotConfig& config);
    ~Arena();

    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    /** @brief Start a new match: fresh board, new random start cells. */
    void restart();
    /** @brief Play one turn; returns false (and does nothing) once the match is over. */
    bool step();

    // Match state
    bool finished() const { return over; }
    /** @brief Id of the last player standing, or -1 for a draw, a solo match, or a match still running. */
    int winner() const;
    int turn() const { return turns; }
    int players() const { return static_cast<int>(live.size()); }
    bool alive(int id) const { return id >= 0 && id < players() && live[static_cast<size_t>(id)]; }
    int aliveCount() const;
    const Board& board() const { return *grid; }
    /** @brief Short description of the last elimination or result. */
    const std::string& lastEvent() const { return event; }

    // Simulation control
    /** @brief Set the match running (true) or paused (false). */
    void setRunning(bool on) { running = on; }
    bool isRunning() const { return running; }
    void toggleRunning() { setRunning(!isRunning()); }
    /** @brief Set the delay between turns in milliseconds; clamped to [5,2000]. */
    void setStepDelayMs(int ms);
    int getStepDelayMs() const { return stepDelayMs; }

    // Rendering
    /** @brief Assign the window used for incremental drawing (nullptr for headless). */
    void setWindow(WINDOW* w) { win = w; }
    /** @brief Full redraw of the board. */
    void draw(WINDOW* w);
    /** @brief Update the bottom status line (turn, players, controls). */
    void drawStatusLine(WINDOW* w);
    /** @brief Color pair for cycle @p id (1..7). */
    static int colorPairForCycle(int id) { return 1 + id % 7; }

private:
    /** @brief Place every player on a distinct random free cell. */
    void placePlayers();
    /** @brief Repaint (x,y) if a window is attached; @p head draws the cell bold. */
    void drawCell(int x, int y, bool head);
    /** @brief Mark the match over when the end condition holds. */
    void checkOver();

    BotConfig cfg;
    std::shared_ptr<WorkerPool> workers; /**< shared by every player's strategy; outlives the board */
    std::unique_ptr<Board> grid;         /**< recreated per match */
    std::vector<bool> live;              /**< per player */
    int turns{0};
    bool over{false};
    std::string event;

    std::random_device rd; /**< entropy for PRNG seeding when no seed is configured */
    std::mt19937 prng;     /**< start position PRNG */

    WINDOW* win{nullptr};
    bool running{false};
    int stepDelayMs{120};
};
