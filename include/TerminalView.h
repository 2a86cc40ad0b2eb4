/**
 * @file TerminalView.h
 * @brief ncurses preview of the emitted circle list (painter's order) plus a status line.
 */
#pragma once

#include "Circle.h"

#include <ncurses.h>
#include <string>
#include <vector>

/** @brief Everything the status line reports; filled by the caller each frame. */
struct ViewStatus {
    std::size_t circles{0};
    std::size_t shown{0};
    int spawned{0};
    unsigned long long generation{0};
    bool generating{false};
    std::string phase;
    int percent{0};
    bool running{false};
    int delayMs{16};
};

class TerminalView {
public:
    /** @brief Define color pairs 1..8 (curses colors 0..7 on the default background). */
    static void initColors();
    /** @brief Curses color index 0..7 nearest to @p c (one bit per channel above 0.5). */
    static int colorIndexFor(const Rgb& c);
    /** @brief Glyph by size: '.', 'o', 'O', '@'. */
    static char glyphFor(float radius);

    /** @brief Erase and draw every record scaled from a canvasW x canvasH canvas into the rows above the status line. */
    void drawAll(WINDOW* w, const std::vector<CircleRecord>& records, int canvasW, int canvasH);
    void drawStatusLine(WINDOW* w, const ViewStatus& st);
};
