/**
 * @file TerminalView.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "TerminalView.h"

#include <algorithm>
#include <cmath>

int TerminalView::width() const {
    if (!win) return 0;
    int rows, cols;
    getmaxyx(win, rows, cols);
    (void)rows;
    return cols;
}

int TerminalView::height() const {
    if (!win) return 0;
    int rows, cols;
    getmaxyx(win, rows, cols);
    (void)cols;
    return std::max(0, rows - 1);
}

/** @copydoc TerminalView::initColors */
void TerminalView::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    // Density spectrum (sparse to dense), then fixed roles
    // 1: blue    sparse
    // 2: cyan
    // 3: green
    // 4: yellow  dense
    // 5: white   background
    // 6: magenta loop entities
    // 7: red     particles
    init_pair(1, COLOR_BLUE, -1);
    init_pair(2, COLOR_CYAN, -1);
    init_pair(3, COLOR_GREEN, -1);
    init_pair(4, COLOR_YELLOW, -1);
    init_pair(5, COLOR_WHITE, -1);
    init_pair(6, COLOR_MAGENTA, -1);
    init_pair(7, COLOR_RED, -1);
}

int TerminalView::colorPairForDensity(double density) {
    if (density < 0.15) return 1;
    if (density < 0.30) return 2;
    if (density < 0.50) return 3;
    return 4;
}

void TerminalView::clear() {
    if (!win) return;
    werase(win);
}

void TerminalView::drawEngine(const GridSimulationEngine& engine, int ox, int oy, int colorPair, chtype glyph) {
    if (!win) return;
    const int maxW = width();
    const int maxH = height();
    wattron(win, COLOR_PAIR(colorPair));
    for (int y = 0; y < engine.rows(); ++y) {
        int sy = oy + y;
        if (sy < 0 || sy >= maxH) continue;
        for (int x = 0; x < engine.cols(); ++x) {
            int sx = ox + x;
            if (sx < 0 || sx >= maxW) continue;
            if (engine.getCell(x, y)) mvwaddch(win, sy, sx, glyph);
        }
    }
    wattroff(win, COLOR_PAIR(colorPair));
}

void TerminalView::drawEntity(const Entity& entity, int colorPair, chtype glyph) {
    if (!entity.sim) return;
    const int cell = std::max(1, entity.cellSize);
    int ox = static_cast<int>(std::floor(entity.x / cell));
    int oy = static_cast<int>(std::floor(entity.y / cell));
    drawEngine(entity.sim->engine(), ox, oy, colorPair, glyph);
}

void TerminalView::drawStatusLine(const std::string& text) {
    if (!win) return;
    int rows, cols;
    getmaxyx(win, rows, cols);
    wmove(win, rows - 1, 0);
    wclrtoeol(win);
    mvwaddnstr(win, rows - 1, 0, text.c_str(), cols - 1);
}

void TerminalView::refresh() {
    if (win) wrefresh(win);
}
