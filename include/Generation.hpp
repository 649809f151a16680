#ifndef GENERATION_HPP
#define GENERATION_HPP

#include "BitBoard.hpp"
#include "Clock.hpp"
#include <cstdint>

// One stored board plus the clock heights it was produced at.
class Generation {
public:
    BitBoard board;
    uint64_t currentHeight;   // Clock reading when this generation was produced
    uint64_t previousHeight;  // Reading at the previous distinct production, 0 if none

    Generation() : currentHeight(0), previousHeight(0) {}
    Generation(const BitBoard& board, uint64_t now)
        : board(board), currentHeight(now), previousHeight(0) {}
    Generation(const BitBoard& board, uint64_t current, uint64_t previous)
        : board(board), currentHeight(current), previousHeight(previous) {}

    // Successor generation. Reads the clock once; does not modify this.
    Generation step(const Clock& clock) const;

    // Live cells in the 3x3 block around (x, y), centre excluded.
    // Cells off the grid count as dead.
    static int liveNeighbours(const BitBoard& board, int x, int y);

    static bool nextCellState(bool alive, int neighbours) {
        return (alive && neighbours == 2) || neighbours == 3;
    }

    bool operator==(const Generation& other) const {
        return board == other.board && currentHeight == other.currentHeight &&
               previousHeight == other.previousHeight;
    }
    bool operator!=(const Generation& other) const { return !(*this == other); }
};

#endif // GENERATION_HPP
