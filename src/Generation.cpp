#include "Generation.hpp"

int Generation::liveNeighbours(const BitBoard& board, int x, int y) {
    int sum = 0;

    // Offsets are shifted by +1 so the window is [x, x+2] x [y, y+2] and the
    // valid range becomes [1, WIDTH] x [1, HEIGHT]; subtract 1 before reading.
    for (int offY = 0; offY <= 2; offY++) {
        int ny = y + offY;
        for (int offX = 0; offX <= 2; offX++) {
            if (offX == 1 && offY == 1) {
                continue;
            }
            int nx = x + offX;
            if (ny >= 1 && nx >= 1 && ny <= BitBoard::HEIGHT && nx <= BitBoard::WIDTH) {
                if (board.isBitSet(nx - 1, ny - 1)) {
                    sum++;
                }
            }
        }
    }

    return sum;
}

Generation Generation::step(const Clock& clock) const {
    BitBoard next;
    uint64_t now = clock.currentHeight();

    for (int y = 0; y < BitBoard::HEIGHT; y++) {
        for (int x = 0; x < BitBoard::WIDTH; x++) {
            bool alive = board.isBitSet(x, y);
            int sum = liveNeighbours(board, x, y);
            if (nextCellState(alive, sum)) {
                next.setBit(x, y, true);
            }
        }
    }

    // Several steps within one tick keep the last distinct height.
    uint64_t previous = (now == currentHeight) ? previousHeight : currentHeight;

    return Generation(next, now, previous);
}
