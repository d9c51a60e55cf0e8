/**
 * @file main.cpp
 * @brief Arcade showcase entry: validates the rule engine, initializes ncurses, installs signal
 *        handlers, runs the 60 Hz host loop and shuts down gracefully.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <thread>

#include "ArcadeConfig.h"
#include "GridSimulationEngine.h"
#include "Logger.h"
#include "RuleValidator.h"
#include "Showcase.h"
#include "TerminalView.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

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
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume after suspension: restore curses program mode and request a redraw.
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);

    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    TerminalView::initColors();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

/** @brief Program entry: sets up terminal UI, builds the scene, handles input, and exits cleanly on signals. */
int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "arcade");
    Logger::info("arcade starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (arcade)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (arcade)"); }
            } else {
                Logger::error("std::terminate (arcade): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    DemoOptions opts;
    opts.applyEnvironment();
    opts.applyArgs(argc, argv);
    opts.validate();
    if (opts.verbosity == Verbosity::Verbose) Logger::setLevel(Logger::Level::Debug);
    {
        std::ostringstream oss;
        oss << "options: rate=" << opts.spriteRate << " loop-rate=" << opts.loopRate
            << " seed=" << (opts.hasSeed ? std::to_string(opts.seed) : std::string("random"));
        Logger::info(oss.str());
    }

    {
        GridSimulationEngine probe(10, 10);
        ValidationResult vr = validateRuntime(probe);
        if (!vr.valid) {
            Logger::error("rule validation failed: " + vr.error);
            Logger::shutdown();
            return 1;
        }
        Logger::info("rule validation passed (B3/S23)");
    }

    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
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
    TerminalView::initColors();

    TerminalView view(stdscr);
    int gridW = view.width();
    int gridH = view.height();
    if (gridH < 20 || gridW < 40) {
        Logger::error("terminal too small: need at least 40x21");
        endwin();
        g_curses_inited = false;
        Logger::shutdown();
        return 1;
    }

    Showcase scene(gridW, gridH, opts);
    scene.setRunning(false); // start paused
    scene.draw(view);
    view.refresh();
    Logger::info("scene initialized: " + std::to_string(gridW) + "x" + std::to_string(gridH));

    bool done = false;
    while (!done) {
        if (g_stop) done = true;
        if (g_needs_full_redraw) {
            clearok(stdscr, TRUE);
            g_needs_full_redraw = 0;
        }

        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested");
                done = true; break;
            case 's': case 'S':
                scene.toggleRunning();
                Logger::info(std::string("running = ") + (scene.isRunning() ? "true" : "false"));
                break;
            case 'p': case 'P':
                scene.setRunning(false);
                Logger::info("paused");
                break;
            case 'r': case 'R':
                scene.respawn();
                break;
            case 'e': case 'E':
                scene.explode();
                Logger::info("explosion");
                break;
            case '+':
                scene.setLoopRate(std::min(arcade_config::MaxLoopUpdateRate, scene.getLoopRate() + 1.0));
                Logger::info("loop rate(fps): " + std::to_string(scene.getLoopRate()));
                break;
            case '-':
                scene.setLoopRate(std::max(arcade_config::MinLoopUpdateRate, scene.getLoopRate() - 1.0));
                Logger::info("loop rate(fps): " + std::to_string(scene.getLoopRate()));
                break;
            default:
                break;
        }

        // One host frame: the scene throttles each engine against HostFrameRate.
        scene.frame();
        scene.draw(view);
        view.refresh();

        std::this_thread::sleep_for(std::chrono::milliseconds(16)); // ~60 FPS host loop
    }

    endwin();
    g_curses_inited = false;
    Logger::info("arcade terminating");
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (arcade)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (arcade)");
        Logger::shutdown();
        return 2;
    }
}
