#include "BoardUtils.hpp"
#include "Base64.hpp"
#include "BitBoard.hpp"
#include "Generation.hpp"
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>

std::string BoardUtils::toJson(const Generation& generation) {
    const BitBoard::Field& field = generation.board.bytes();

    std::ostringstream oss;
    oss << "{\"board\":{\"field\":\"" << Base64::encode(field.data(), field.size()) << "\"},"
        << "\"current_block_height\":" << generation.currentHeight << ","
        << "\"prev_block_height\":" << generation.previousHeight << "}";
    return oss.str();
}

void BoardUtils::printBoard(const BitBoard& board, std::ostream& out) {
    // Column ruler: last digit of x
    out << "   ";
    for (int x = 0; x < BitBoard::WIDTH; x++) {
        out << (x % 10);
    }
    out << "\n";

    std::vector<std::string> rows = board.toRows();
    for (int y = 0; y < BitBoard::HEIGHT; y++) {
        out << std::setw(2) << y << " " << rows[y] << "\n";
    }
}

void BoardUtils::printGeneration(const Generation& generation, std::ostream& out) {
    printBoard(generation.board, out);
    out << "Live cells: " << generation.board.population()
        << ", height: " << generation.currentHeight
        << ", previous height: " << generation.previousHeight << "\n";
}

uint64_t BoardUtils::parseUnsigned(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Expected a number, got an empty string");
    }

    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Not an unsigned number: " + text);
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw std::invalid_argument("Number out of range: " + text);
        }
        value = value * 10 + digit;
    }
    return value;
}
