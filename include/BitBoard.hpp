#ifndef BITBOARD_HPP
#define BITBOARD_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// 16x16 cell field packed one bit per cell, row-major, LSB first within a byte.
class BitBoard {
public:
    static constexpr int WIDTH = 16;
    static constexpr int HEIGHT = 16;
    static constexpr size_t FIELD_LEN = (WIDTH / 8) * HEIGHT;

    using Field = std::array<uint8_t, FIELD_LEN>;

private:
    Field field;

    static int toIndex(int x, int y) {
        return y * WIDTH + x;
    }

public:
    BitBoard();

    // Throws InvalidBufferLength unless bytes.size() == FIELD_LEN.
    static BitBoard fromBytes(const std::vector<uint8_t>& bytes);
    static BitBoard fromBytes(const uint8_t* data, size_t length);

    // Core operations. Coordinates must be in [0, WIDTH) x [0, HEIGHT).
    bool isBitSet(int x, int y) const;
    void setBit(int x, int y, bool value);
    void clear();

    // One string per row, top row first, x = 0 leftmost.
    std::vector<std::string> toRows(char alive = 'X', char dead = '.') const;

    const Field& bytes() const { return field; }
    std::vector<uint8_t> toVector() const { return std::vector<uint8_t>(field.begin(), field.end()); }
    int population() const;

    bool operator==(const BitBoard& other) const { return field == other.field; }
    bool operator!=(const BitBoard& other) const { return field != other.field; }
};

#endif // BITBOARD_HPP
