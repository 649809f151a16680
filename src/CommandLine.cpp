#include "CommandLine.hpp"
#include "BoardService.hpp"
#include "BoardUtils.hpp"
#include "Clock.hpp"
#include "GenerationStore.hpp"
#include "LogSink.hpp"
#include "Registry.hpp"
#include <exception>
#include <ostream>
#include <stdexcept>

CommandLine::Options CommandLine::parse(const std::vector<std::string>& args) {
    Options options;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--state" || arg == "--height") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Option " + arg + " needs a value");
            }
            if (arg == "--state") {
                options.statePath = args[++i];
            } else {
                options.height = BoardUtils::parseUnsigned(args[++i]);
            }
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            options.positional.push_back(arg);
        }
    }

    return options;
}

void CommandLine::printUsage(std::ostream& out) {
    out << "Usage: lifechain [--state FILE] [--height N] [--quiet] <command> [arg]\n"
        << "Commands:\n"
        << "  init            create an empty state file\n"
        << "  create <field>  store a base64 packed field, prints its index\n"
        << "  get <index>     print a stored board\n"
        << "  step <index>    advance a stored board by one generation\n"
        << "  json <index>    print a stored board as JSON\n"
        << "  count           print the number of stored boards\n"
        << "Without --height the clock stays at the latest stored height.\n";
}

int CommandLine::run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    try {
        Options options = parse(args);
        if (options.help) {
            printUsage(out);
            return 0;
        }
        if (options.positional.empty()) {
            printUsage(err);
            return 1;
        }

        const std::string& command = options.positional[0];
        auto requireArg = [&]() -> const std::string& {
            if (options.positional.size() < 2) {
                throw std::invalid_argument("Command '" + command + "' needs an argument");
            }
            return options.positional[1];
        };

        FileStore store(options.statePath);
        ManualClock clock;
        Registry registry(store, clock);
        ConsoleSink sink(out);
        BoardService service(registry, sink,
                             options.quiet ? BoardService::Config::quiet() : BoardService::Config::defaults());

        if (command == "init") {
            service.initialize();
            out << "Initialized " << options.statePath << " (" << registry.size() << " boards)" << std::endl;
            return 0;
        }

        // The clock never reads below what the registry has already seen
        // unless the caller says so explicitly; advance() rejects that case.
        clock.setHeight(options.height ? *options.height : registry.latestHeight());

        if (command == "create") {
            BoardIndex index = service.createBoard(requireArg());
            out << "Created board " << index << std::endl;
        } else if (command == "get") {
            BoardIndex index = BoardUtils::parseUnsigned(requireArg());
            std::optional<Generation> generation = service.getBoard(index);
            if (!generation) {
                err << "No board at index " << index << std::endl;
                return 1;
            }
            BoardUtils::printGeneration(*generation, out);
        } else if (command == "step") {
            BoardIndex index = BoardUtils::parseUnsigned(requireArg());
            Generation next = service.stepBoard(index);
            BoardUtils::printGeneration(next, out);
        } else if (command == "json") {
            BoardIndex index = BoardUtils::parseUnsigned(requireArg());
            out << BoardUtils::toJson(registry.get(index)) << std::endl;
        } else if (command == "count") {
            out << registry.size() << std::endl;
        } else {
            err << "Unknown command: " << command << "\n";
            printUsage(err);
            return 1;
        }
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
