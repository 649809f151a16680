#include "BoardService.hpp"
#include "BoardUtils.hpp"
#include "Clock.hpp"
#include "GenerationStore.hpp"
#include "LogSink.hpp"
#include "Registry.hpp"
#include <cstdlib>
#include <iostream>

// Runs the five-cell pattern at (4,4),(5,4),(6,4),(6,3),(6,2) for ten steps,
// one clock tick per step. Usage: ./lifechain_demo [steps]
int main(int argc, char* argv[]) {
    std::cout << "Running LifeChain demo..." << std::endl;

    int steps = (argc >= 2) ? std::atoi(argv[1]) : 10;

    MemoryStore store;
    ManualClock clock(1);
    Registry registry(store, clock);
    NullSink sink;
    BoardService service(registry, sink, BoardService::Config::quiet());
    service.initialize();

    BitBoard board;
    board.setBit(4, 4, true);
    board.setBit(5, 4, true);
    board.setBit(6, 4, true);
    board.setBit(6, 3, true);
    board.setBit(6, 2, true);

    BoardIndex index = service.createBoard(board.toVector());
    std::cout << "Initial board" << std::endl;
    BoardUtils::printGeneration(registry.get(index), std::cout);

    for (int step = 0; step < steps; step++) {
        clock.tick();
        Generation next = service.stepBoard(index);
        std::cout << "Step #" << step << std::endl;
        BoardUtils::printGeneration(next, std::cout);
    }

    std::cout << BoardUtils::toJson(registry.get(index)) << std::endl;
    return 0;
}
