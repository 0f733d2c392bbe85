/**
 * @file Arena.cpp
 * @brief Arena implementation: match rules, start placement, and incremental ncurses rendering.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Arena.h"
#include "Cycle.h"
#include "Direction.h"
#include "Logger.h"
#include "Session.h"
#include "WorkerPool.h"

#include <algorithm>

/** @copydoc Arena::Arena */
Arena::Arena(const BotConfig& config)
    : cfg(config), workers(Session::makePool(config)),
      prng(config.seed != 0 ? config.seed : rd()) {
    cfg.players = std::max(1, std::min({cfg.players, 8, cfg.width * cfg.height}));
    setStepDelayMs(cfg.stepDelayMs);
    restart();
}

/** @copydoc Arena::~Arena */
Arena::~Arena() {
    Logger::info("arena: shutting down after " + std::to_string(turns) + " turns");
}

/** @copydoc Arena::restart */
void Arena::restart() {
    grid = std::make_unique<Board>(cfg.width, cfg.height);
    live.assign(static_cast<size_t>(cfg.players), true);
    turns = 0;
    over = false;
    event.clear();
    placePlayers();
    for (int id = 0; id < cfg.players; ++id) {
        grid->cycle(id)->setStrategy(Session::makeAggregator(cfg, workers));
    }
    Logger::info("arena: new match " + std::to_string(cfg.width) + "x" + std::to_string(cfg.height) +
                 " players=" + std::to_string(cfg.players));
    if (win) draw(win);
}

/** @copydoc Arena::placePlayers */
void Arena::placePlayers() {
    // Random unique positions
    const int total = cfg.width * cfg.height;
    std::vector<int> posIdx(static_cast<size_t>(total));
    for (int i = 0; i < total; ++i) posIdx[static_cast<size_t>(i)] = i;
    std::shuffle(posIdx.begin(), posIdx.end(), prng);

    for (int id = 0; id < cfg.players; ++id) {
        int p = posIdx[static_cast<size_t>(id)];
        int x = p % cfg.width;
        int y = p / cfg.width;
        grid->cycle(id)->touch(x, y);
        Logger::debug("arena: player " + std::to_string(id) + " starts at " + Coordinates(x, y).str());
    }
}

/** @copydoc Arena::step */
bool Arena::step() {
    if (over) return false;
    ++turns;
    for (int id = 0; id < players(); ++id) {
        if (!live[static_cast<size_t>(id)]) continue;
        auto c = grid->cycle(id);
        const Coordinates from = *c->position();
        const Direction d = c->choose();
        const Coordinates to = ::step(from, d);

        if (!grid->isFree(to.x, to.y)) {
            live[static_cast<size_t>(id)] = false;
            std::vector<Coordinates> freed = c->path();
            c->destroy();
            for (const auto& cell : freed) drawCell(cell.x, cell.y, false);
            event = "turn " + std::to_string(turns) + ": player " + std::to_string(id) + " crashed going " + toString(d);
            Logger::info("arena: " + event);
            continue;
        }
        c->touch(to.x, to.y);
        drawCell(from.x, from.y, false);
        drawCell(to.x, to.y, true);
    }
    checkOver();
    if (win) wrefresh(win);
    return true;
}

/** @copydoc Arena::checkOver */
void Arena::checkOver() {
    const int left = aliveCount();
    const int threshold = players() > 1 ? 1 : 0;
    if (left > threshold && turns < cfg.width * cfg.height) return;
    over = true;
    const int w = winner();
    if (w >= 0) event = "player " + std::to_string(w) + " wins after " + std::to_string(turns) + " turns";
    else event = "match over after " + std::to_string(turns) + " turns";
    Logger::info("arena: " + event);
}

/** @copydoc Arena::winner */
int Arena::winner() const {
    if (!over || players() < 2 || aliveCount() != 1) return -1;
    for (int id = 0; id < players(); ++id) if (live[static_cast<size_t>(id)]) return id;
    return -1;
}

/** @copydoc Arena::aliveCount */
int Arena::aliveCount() const {
    return static_cast<int>(std::count(live.begin(), live.end(), true));
}

/** @copydoc Arena::setStepDelayMs */
void Arena::setStepDelayMs(int ms) {
    if (ms < 5) ms = 5;
    if (ms > 2000) ms = 2000;
    stepDelayMs = ms;
}

/** @copydoc Arena::draw */
void Arena::draw(WINDOW* w) {
    if (!w) return;
    WINDOW* saved = win;
    win = w;
    for (int y = 0; y < grid->height(); ++y) {
        for (int x = 0; x < grid->width(); ++x) drawCell(x, y, false);
    }
    for (int id = 0; id < players(); ++id) {
        if (!live[static_cast<size_t>(id)]) continue;
        const auto& p = grid->cycle(id)->position();
        if (p) drawCell(p->x, p->y, true);
    }
    wrefresh(w);
    win = saved;
}

/** @copydoc Arena::drawStatusLine */
void Arena::drawStatusLine(WINDOW* w) {
    if (!w) return;
    int rows, cols;
    getmaxyx(w, rows, cols);
    std::string line = "turn " + std::to_string(turns) + " | alive:";
    for (int id = 0; id < players(); ++id) {
        if (live[static_cast<size_t>(id)]) line += " " + std::to_string(id);
    }
    line += " | [s]tart/stop [n]ext [r]estart [+/-] speed [q]uit";
    if (!event.empty()) line += " | " + event;
    if (static_cast<int>(line.size()) > cols) line.resize(static_cast<size_t>(cols));
    mvwhline(w, rows - 1, 0, ' ', cols);
    mvwaddnstr(w, rows - 1, 0, line.c_str(), cols);
    wrefresh(w);
}

void Arena::drawCell(int x, int y, bool head) {
    if (!win) return;
    Board::Cell c = grid->get(x, y);
    if (c == 0 || c == Board::OutOfRange) {
        mvwaddch(win, y, x, ' ');
        return;
    }
    const int id = static_cast<int>(c) - 1;
    const int pair = colorPairForCycle(id);
    if (head) wattron(win, A_BOLD);
    wattron(win, COLOR_PAIR(pair));
    mvwaddch(win, y, x, head ? static_cast<chtype>('0' + id % 10) : static_cast<chtype>(ACS_CKBOARD));
    wattroff(win, COLOR_PAIR(pair));
    if (head) wattroff(win, A_BOLD);
}
