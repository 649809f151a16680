#ifndef COMMANDLINE_HPP
#define COMMANDLINE_HPP

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

// The lifechain command line: option parsing and command dispatch over a
// FileStore. Kept out of main() so the commands can be driven from tests.
class CommandLine {
public:
    struct Options {
        std::string statePath;
        std::optional<uint64_t> height;  // Unset: continue from the latest stored height
        bool quiet;
        bool help;
        std::vector<std::string> positional;

        Options() : statePath("lifechain.dat"), quiet(false), help(false) {}
    };

    // args excludes the program name. Throws std::invalid_argument.
    static Options parse(const std::vector<std::string>& args);

    // Returns the process exit status. Errors are reported on err as
    // "Error: <message>".
    static int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

    static void printUsage(std::ostream& out);
};

#endif // COMMANDLINE_HPP
