#include "CommandLine.hpp"
#include <iostream>
#include <string>
#include <vector>

// How to run:
//   ./lifechain --state boards.dat init
//   ./lifechain --state boards.dat --height 7 create AAAAAEAAQABwAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=
//   ./lifechain --state boards.dat --height 8 step 0
int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return CommandLine::run(args, std::cout, std::cerr);
}
