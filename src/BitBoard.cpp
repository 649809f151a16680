#include "BitBoard.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <utility>

BitBoard::BitBoard() {
    // Initialize all bits to 0
    field.fill(0);
}

BitBoard BitBoard::fromBytes(const std::vector<uint8_t>& bytes) {
    return fromBytes(bytes.data(), bytes.size());
}

BitBoard BitBoard::fromBytes(const uint8_t* data, size_t length) {
    if (length != FIELD_LEN) {
        throw InvalidBufferLength(length, FIELD_LEN);
    }

    BitBoard board;
    std::copy(data, data + length, board.field.begin());
    return board;
}

bool BitBoard::isBitSet(int x, int y) const {
    int index = toIndex(x, y);
    int byteIndex = index / 8;
    int bit = index % 8;

    return (field[byteIndex] >> bit) & 1;
}

void BitBoard::setBit(int x, int y, bool value) {
    int index = toIndex(x, y);
    int byteIndex = index / 8;
    int bit = index % 8;

    if (value) {
        field[byteIndex] |= static_cast<uint8_t>(1u << bit);
    } else {
        field[byteIndex] &= static_cast<uint8_t>(~(1u << bit));
    }
}

void BitBoard::clear() {
    field.fill(0);
}

std::vector<std::string> BitBoard::toRows(char alive, char dead) const {
    std::vector<std::string> rows;
    rows.reserve(HEIGHT);

    for (int y = 0; y < HEIGHT; y++) {
        std::string row(WIDTH, dead);
        for (int x = 0; x < WIDTH; x++) {
            if (isBitSet(x, y)) {
                row[x] = alive;
            }
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

int BitBoard::population() const {
    int count = 0;
    for (uint8_t byte : field) {
        // Kernighan's trick, one iteration per set bit
        while (byte) {
            byte &= static_cast<uint8_t>(byte - 1);
            count++;
        }
    }
    return count;
}
