#ifndef BOARD_SERVICE_HPP
#define BOARD_SERVICE_HPP

#include "BitBoard.hpp"
#include "Generation.hpp"
#include "LogSink.hpp"
#include "Registry.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// The externally callable surface: initialize, create, get and step.
// Each call runs to completion and either succeeds or throws without
// touching the registry.
class BoardService {
public:
    struct Config {
        bool logBoards = true;  // Echo board rows on every create/get/step
        char aliveGlyph = 'X';
        char deadGlyph = '.';

        static Config defaults() { return Config(); }

        static Config quiet() {
            Config c;
            c.logBoards = false;
            return c;
        }
    };

    BoardService(Registry& registry, LogSink& sink);
    BoardService(Registry& registry, LogSink& sink, const Config& config);

    void initialize();

    // encodedField is the base64 text of a FIELD_LEN-byte packed field.
    // Throws InvalidEncoding or InvalidBufferLength.
    BoardIndex createBoard(const std::string& encodedField);
    BoardIndex createBoard(const std::vector<uint8_t>& field);

    std::optional<Generation> getBoard(BoardIndex index);

    // Throws IndexNotFound.
    Generation stepBoard(BoardIndex index);

    const Config& getConfig() const { return config_; }

private:
    Registry& registry_;
    LogSink& sink_;
    Config config_;

    void logBoard(const BitBoard& board);
    void logBoard(const std::string& title, const BitBoard& board);
};

#endif // BOARD_SERVICE_HPP
