/**
 * @file TerminalView.h
 * @brief ncurses renderer for the showcase: draws simulation grids as characters.
 *
 * Reads engines only; it never mutates simulation state.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <ncurses.h>
#include <string>

#include "Entity.h"
#include "GridSimulationEngine.h"

/**
 * @class TerminalView
 * @brief Maps grid cells to terminal cells (one character per cell) inside a WINDOW.
 */
class TerminalView {
public:
    explicit TerminalView(WINDOW* w = nullptr) : win(w) {}

    /** @brief Drawable width in characters. */
    int width() const;
    /** @brief Drawable height in characters, excluding the status line. */
    int height() const;

    /** @brief Install the color pairs used by drawEngine (call once after initscr). */
    static void initColors();

    /** @brief Blank the drawable area. */
    void clear();
    /** @brief Draw the live cells of @p engine with the top-left at (ox,oy); clipped to the window. */
    void drawEngine(const GridSimulationEngine& engine, int ox, int oy, int colorPair, chtype glyph);
    /** @brief Draw an entity's simulation at its position (pixels divided by cellSize). */
    void drawEntity(const Entity& entity, int colorPair, chtype glyph);
    /** @brief Replace the bottom status line. */
    void drawStatusLine(const std::string& text);
    /** @brief Push pending output to the terminal. */
    void refresh();

    /** @brief Map a density in [0,1] to one of the showcase color pairs. */
    static int colorPairForDensity(double density);

private:
    WINDOW* win{nullptr}; /**< ncurses window for drawing */
};
