/**
 * @file TerminalView.cpp
 */
#include "TerminalView.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace {
inline int clampi(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
}

void TerminalView::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    // 1: BLACK, 2: RED, 3: GREEN, 4: YELLOW, 5: BLUE, 6: MAGENTA, 7: CYAN, 8: WHITE
    init_pair(1, COLOR_BLACK, -1);
    init_pair(2, COLOR_RED, -1);
    init_pair(3, COLOR_GREEN, -1);
    init_pair(4, COLOR_YELLOW, -1);
    init_pair(5, COLOR_BLUE, -1);
    init_pair(6, COLOR_MAGENTA, -1);
    init_pair(7, COLOR_CYAN, -1);
    init_pair(8, COLOR_WHITE, -1);
}

int TerminalView::colorIndexFor(const Rgb& c) {
    // curses numbering is red=1, green=2, blue=4
    return (c.r > 0.5f ? 1 : 0) | (c.g > 0.5f ? 2 : 0) | (c.b > 0.5f ? 4 : 0);
}

char TerminalView::glyphFor(float radius) {
    if (radius < 4.0f) return '.';
    if (radius < 8.0f) return 'o';
    if (radius < 16.0f) return 'O';
    return '@';
}

void TerminalView::drawAll(WINDOW* w, const std::vector<CircleRecord>& records, int canvasW, int canvasH) {
    if (!w || canvasW <= 0 || canvasH <= 0) return;
    int rows, cols; getmaxyx(w, rows, cols);
    int gridH = rows - 1;
    if (gridH < 1 || cols < 1) return;
    werase(w);
    const float sx = (float)canvasW / (float)cols;
    const float sy = (float)canvasH / (float)gridH;
    for (const auto& rec : records) {
        int idx = colorIndexFor(rec.color);
        int pair = idx + 1;
        // black on the default background is unreadable; draw it white instead
        if (idx == 0) pair = 8;
        bool bold = brightnessOf(rec.color) > 0.6f;
        char glyph = glyphFor(rec.radius);
        int c0 = clampi((int)std::floor((rec.x - rec.radius) / sx), 0, cols - 1);
        int c1 = clampi((int)std::floor((rec.x + rec.radius) / sx), 0, cols - 1);
        int r0 = clampi((int)std::floor((rec.y - rec.radius) / sy), 0, gridH - 1);
        int r1 = clampi((int)std::floor((rec.y + rec.radius) / sy), 0, gridH - 1);
        if (bold) wattron(w, A_BOLD);
        wattron(w, COLOR_PAIR(pair));
        bool any = false;
        for (int r = r0; r <= r1; ++r) {
            for (int c = c0; c <= c1; ++c) {
                float cx = (c + 0.5f) * sx, cy = (r + 0.5f) * sy;
                float dx = cx - rec.x, dy = cy - rec.y;
                if (dx * dx + dy * dy > rec.radius * rec.radius) continue;
                mvwaddch(w, r, c, glyph);
                any = true;
            }
        }
        // Circles smaller than a cell still get one glyph at their centre.
        if (!any) {
            mvwaddch(w, clampi((int)(rec.y / sy), 0, gridH - 1), clampi((int)(rec.x / sx), 0, cols - 1), glyph);
        }
        wattroff(w, COLOR_PAIR(pair));
        if (bold) wattroff(w, A_BOLD);
    }
    wnoutrefresh(w);
}

void TerminalView::drawStatusLine(WINDOW* w, const ViewStatus& st) {
    if (!w) return;
    int rows, cols; getmaxyx(w, rows, cols);
    int y = rows - 1;
    wmove(w, y, 0); wclrtoeol(w);
    char gen[64];
    if (st.generating) snprintf(gen, sizeof(gen), "%s %d%%", st.phase.c_str(), st.percent);
    else snprintf(gen, sizeof(gen), "layout #%llu", st.generation);
    char status[256];
    snprintf(status, sizeof(status),
             "Circles: %zu (shown %zu)  Spawned: %d  [%s]  Delay(ms): %d  %s  | [s]tart/[p]ause  [r]egenerate  speed[-/+]  [q]uit",
             st.circles, st.shown, st.spawned, gen, st.delayMs, (st.running ? "RUNNING" : "PAUSED"));
    int len = (int)strlen(status);
    if (len < cols) mvwprintw(w, y, 0, "%s%*s", status, cols - len, "");
    else mvwaddnstr(w, y, 0, status, cols);
    wnoutrefresh(w);
}
