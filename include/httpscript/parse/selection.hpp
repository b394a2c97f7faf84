/*
 * HTTPScript Source Selection
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Position/Selection pairs attached to every AST node and inline script.
 *   Used only for diagnostics.
 */
#pragma once
#include <cstddef>
#include <string>

namespace httpscript {

struct Position {
    std::size_t line = 0; // 1-based, 0 means unknown
    std::size_t col = 0;  // 1-based
};

inline bool operator==(const Position& a, const Position& b) { return a.line == b.line && a.col == b.col; }
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

struct Selection {
    std::string filename;
    Position start;
    Position end;

    static Selection none() { return Selection{}; }

    // "file:line:col", or just the filename when the position is unknown
    std::string to_string() const {
        if (start.line == 0) return filename;
        return filename + ":" + std::to_string(start.line) + ":" + std::to_string(start.col);
    }
};

inline bool operator==(const Selection& a, const Selection& b) {
    return a.filename == b.filename && a.start == b.start && a.end == b.end;
}

} // namespace httpscript
