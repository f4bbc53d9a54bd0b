#include <iostream>
#include <string>
#include <vector>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../core/Errors.hpp"
#include "../core/MemoryModel.hpp"
#include "../storage/Storage.hpp"
#include "../service/FlashcardService.hpp"
#include "Config.hpp"
#include "ToolHandler.hpp"

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Config config;
    try {
        config = Config::resolve(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const ValidationError& e) {
        std::cerr << e.what() << "\n" << Config::usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << Config::usage(argv[0]);
        return 0;
    }

    try {
        Log::init(config.log_file, config.log_level);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to open log file " << config.log_file << ": " << e.what() << "\n";
        return 1;
    }

    spdlog::info("Starting flashcards with data file '{}'", config.data_file);

    Storage storage(config.data_file);
    try {
        storage.load();
    }
    catch (const FlashcardError& e) {
        spdlog::error("Failed to load {}: {}", config.data_file, e.what());
        std::cerr << "Failed to load " << config.data_file << ": " << e.what() << "\n";
        return 1;
    }

    MemoryModel model;
    FlashcardService service(storage, model);
    ToolHandler handler(service);

    handler.run(std::cin, std::cout);

    spdlog::info("Shutting down");
    spdlog::shutdown();
    return 0;
}
