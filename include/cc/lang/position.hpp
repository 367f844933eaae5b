#pragma once

#include <cstdint>

namespace cc {

// Location of a character in a loaded file. `file` indexes CharStream's
// file table; line and col are 1-based.
struct Position {
    uint32_t file = 0;
    uint32_t line = 0;
    uint32_t col = 0;

    bool operator==(const Position& o) const {
        return file == o.file && line == o.line && col == o.col;
    }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

} // namespace cc
