/**
 * @file main.cpp
 * @brief Arena entry: initializes ncurses, installs signal handlers, plays bot matches, and shuts down gracefully.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#include <ncurses.h>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include "Arena.h"
#include "Config.h"
#include "Logger.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

// Forward decl for use in signal handler
static void init_colors();

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Handle terminal suspension (Ctrl+Z): restore tty before stopping.
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode(); // save current curses state
        endwin();        // restore tty modes for the shell
        g_curses_inited = false;
    }
    // Revert to default action and re-raise to actually stop the process
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume after suspension: restore curses program mode and redraw UI
static void handle_sigcont(int) {
    // Reinstall our SIGTSTP handler
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);

    reset_prog_mode(); // restore saved curses state
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

/** @brief Initialize ncurses color pairs 1..7, one per player slot (see Arena::colorPairForCycle). */
static void init_colors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(1, COLOR_RED, -1);
    init_pair(2, COLOR_GREEN, -1);
    init_pair(3, COLOR_YELLOW, -1);
    init_pair(4, COLOR_BLUE, -1);
    init_pair(5, COLOR_MAGENTA, -1);
    init_pair(6, COLOR_CYAN, -1);
    init_pair(7, COLOR_WHITE, -1);
}

/** @brief Program entry: sets up terminal UI, runs matches on keypress, and exits cleanly on signals. */
int main(int argc, char** argv) {
    BotConfig cfg;
    cfg.applyEnvironment();
    std::vector<std::string> unknown = cfg.applyArgs(argc, argv);
    for (const auto& a : unknown) {
        if (a == "-h" || a == "--help") {
            std::cout << BotConfig::usage(argc > 0 ? argv[0] : "lightcycle_arena");
            return 0;
        }
    }

    if (!cfg.logFile.empty()) Logger::init(cfg.logFile);
    else Logger::initFromArgv0((argc > 0) ? argv[0] : "lightcycle_arena");
    Logger::setLevel(cfg.logLevel);
    for (const auto& a : unknown) Logger::warn("ignoring unknown argument: " + a);
    Logger::info("arena starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (arena)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (arena)"); }
            } else {
                Logger::error("std::terminate (arena): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    // Suspend/resume handlers
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // non-blocking getch
    timeout(0);
    init_colors();

    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    if (rows - 1 < cfg.height || cols < cfg.width) {
        endwin();
        g_curses_inited = false;
        Logger::error("terminal too small: need " + std::to_string(cfg.width) + "x" + std::to_string(cfg.height + 1) +
                      ", have " + std::to_string(cols) + "x" + std::to_string(rows));
        Logger::shutdown();
        return 1;
    }

    Arena arena(cfg);
    arena.setWindow(stdscr);
    arena.draw(stdscr); // initial full draw only
    arena.setRunning(false); // start paused
    Logger::info("arena initialized: " + cfg.describe());

    using namespace std::chrono;
    auto lastStep = steady_clock::now();
    bool done = false;
    while (!done) {
        if (g_stop) done = true;
        if (g_needs_full_redraw) {
            arena.draw(stdscr);
            g_needs_full_redraw = 0;
        }
        if (arena.isRunning() && !arena.finished()) {
            auto now = steady_clock::now();
            if (duration_cast<milliseconds>(now - lastStep).count() >= arena.getStepDelayMs()) {
                arena.step();
                lastStep = now;
            }
        } else {
            // keep time reference fresh while paused
            lastStep = steady_clock::now();
        }
        arena.drawStatusLine(stdscr);

        int ch = getch();
        switch (ch) {
            case 'q':
            case 'Q':
                Logger::info("quit requested");
                done = true; break;
            case 's': case 'S':
                arena.toggleRunning();
                Logger::info(std::string("running = ") + (arena.isRunning()?"true":"false"));
                break;
            case 'n': case 'N':
                arena.setRunning(false);
                arena.step();
                break;
            case 'r': case 'R':
                arena.restart();
                Logger::info("restart requested");
                break;
            case '+':
                arena.setStepDelayMs(arena.getStepDelayMs() - 10);
                Logger::info("delay set(ms): " + std::to_string(arena.getStepDelayMs()));
                break;
            case '-':
                arena.setStepDelayMs(arena.getStepDelayMs() + 10);
                Logger::info("delay set(ms): " + std::to_string(arena.getStepDelayMs()));
                break;
            default:
                break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(16)); // ~60 FPS UI
    }

    endwin();
    g_curses_inited = false;
    Logger::info("arena terminating");
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (arena)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (arena)");
        Logger::shutdown();
        return 2;
    }
}
