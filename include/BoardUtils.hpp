#ifndef BOARDUTILS_HPP
#define BOARDUTILS_HPP

#include <cstdint>
#include <iosfwd>
#include <string>

// Forward declarations
class BitBoard;
class Generation;

class BoardUtils {
public:
    // {"board":{"field":"<base64>"},"current_block_height":N,"prev_block_height":M}
    static std::string toJson(const Generation& generation);

    // Board printing
    static void printBoard(const BitBoard& board, std::ostream& out);
    static void printGeneration(const Generation& generation, std::ostream& out);

    // Whole-string unsigned decimal parse; throws std::invalid_argument.
    static uint64_t parseUnsigned(const std::string& text);
};

#endif // BOARDUTILS_HPP
