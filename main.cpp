#include <iostream>
#include <string>

#include "config.hpp"
#include "engine.hpp"

static eliza::EngineOptions engineOptions(const eliza::Config &config) {
    eliza::EngineOptions options;
    options.seed = config.seed;
    options.memoryCapacity = (std::size_t)config.memorySize;
    options.maxInputChars = (std::size_t)config.maxInputChars;
    if (config.debug) {
        options.onDebug = [](const std::string &msg) {
            std::cerr << "[Engine] " << msg << std::endl;
        };
    }
    return options;
}

int main(int argc, char **argv) {
    const auto config = eliza::loadConfig(argc, argv);
    auto engine = eliza::Engine::fromSource(config.scriptPath.string(), engineOptions(config));

    std::cout << "============================================================" << std::endl;
    std::cout << "ELIZA - a rule-driven conversation engine" << std::endl;
    std::cout << "============================================================" << std::endl;
    std::cout << "Type 'quit' or 'exit' to end the conversation." << std::endl << std::endl;
    std::cout << "ELIZA: " << engine.initialPrompt() << std::endl << std::endl;

    std::string line;
    while (true) {
        std::cout << "You: " << std::flush;
        if (!std::getline(std::cin, line)) {
            if (!std::cin.eof()) std::cerr << "[Console] Error reading input." << std::endl;
            std::cout << std::endl;
            break;
        }
        if (engine.isQuitWord(line)) {
            std::cout << std::endl << "ELIZA: Goodbye. It was nice talking to you." << std::endl;
            break;
        }
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        std::string reply = engine.respond(line);
        if (config.debug) {
            const auto &trace = engine.lastTrace();
            std::cerr << "[Engine] stage=" << eliza::stageName(trace.stage) << " keyword=" << trace.keyword
                      << " memory=" << engine.memory().size() << std::endl;
        }
        std::cout << "ELIZA: " << reply << std::endl << std::endl;
    }
    return 0;
}
