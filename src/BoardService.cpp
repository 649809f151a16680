#include "BoardService.hpp"
#include "Base64.hpp"

BoardService::BoardService(Registry& registry, LogSink& sink)
    : BoardService(registry, sink, Config::defaults()) {
}

BoardService::BoardService(Registry& registry, LogSink& sink, const Config& config)
    : registry_(registry)
    , sink_(sink)
    , config_(config) {
}

void BoardService::initialize() {
    registry_.initialize();
}

BoardIndex BoardService::createBoard(const std::string& encodedField) {
    return createBoard(Base64::decode(encodedField));
}

BoardIndex BoardService::createBoard(const std::vector<uint8_t>& field) {
    BitBoard board = BitBoard::fromBytes(field);
    BoardIndex index = registry_.create(board);
    logBoard(board);
    return index;
}

std::optional<Generation> BoardService::getBoard(BoardIndex index) {
    std::optional<Generation> generation = registry_.find(index);
    if (generation) {
        logBoard(generation->board);
    }
    return generation;
}

Generation BoardService::stepBoard(BoardIndex index) {
    Generation old = registry_.get(index);
    logBoard("Old board", old.board);

    Generation next = registry_.advance(index);
    logBoard("New board", next.board);
    return next;
}

void BoardService::logBoard(const std::string& title, const BitBoard& board) {
    if (!config_.logBoards) {
        return;
    }
    sink_.line(title);
    logBoard(board);
}

void BoardService::logBoard(const BitBoard& board) {
    if (!config_.logBoards) {
        return;
    }
    sink_.lines(board.toRows(config_.aliveGlyph, config_.deadGlyph));
}
