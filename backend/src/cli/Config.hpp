#pragma once
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

// Runtime settings: defaults, then FLASHCARDS_* environment variables, then flags.
struct Config {
    std::string data_file = "./flashcards.json";
    std::string log_file = "flashcards.log";
    spdlog::level::level_enum log_level = spdlog::level::info;
    bool show_help = false;

    // args excludes the program name. Throws ValidationError on unknown flags,
    // missing flag values and unknown log levels.
    static Config resolve(const std::vector<std::string>& args);

    static spdlog::level::level_enum parseLevel(const std::string& name);
    static std::string usage(const std::string& program);
};
