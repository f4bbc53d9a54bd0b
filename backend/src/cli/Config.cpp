#include "Config.hpp"
#include "../core/Errors.hpp"
#include <cstdlib>

namespace {
    void fromEnv(const char* name, std::string& target) {
        const char* value = std::getenv(name);
        if (value && *value) target = value;
    }
}

spdlog::level::level_enum Config::parseLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps anything it does not know to "off"
    if (level == spdlog::level::off && name != "off") {
        throw ValidationError("invalid log level: " + name);
    }
    return level;
}

Config Config::resolve(const std::vector<std::string>& args) {
    Config cfg;

    std::string level_name;
    fromEnv("FLASHCARDS_FILE", cfg.data_file);
    fromEnv("FLASHCARDS_LOG_FILE", cfg.log_file);
    fromEnv("FLASHCARDS_LOG_LEVEL", level_name);

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            cfg.show_help = true;
            continue;
        }

        std::string flag = arg;
        std::string value;
        bool has_value = false;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            flag = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            has_value = true;
        }

        if (flag != "--file" && flag != "--log-file" && flag != "--log-level") {
            throw ValidationError("unknown argument: " + arg);
        }
        if (!has_value) {
            if (i + 1 >= args.size()) {
                throw ValidationError("missing value for " + flag);
            }
            value = args[++i];
        }

        if (flag == "--file") cfg.data_file = value;
        else if (flag == "--log-file") cfg.log_file = value;
        else level_name = value;
    }

    if (!level_name.empty()) cfg.log_level = parseLevel(level_name);
    if (cfg.data_file.empty()) {
        throw ValidationError("data file path cannot be empty");
    }
    return cfg;
}

std::string Config::usage(const std::string& program) {
    return "Usage: " + program + " [--file PATH] [--log-file PATH] [--log-level LEVEL]\n"
        "\n"
        "Reads one JSON request per line on stdin and answers on stdout:\n"
        "  {\"tool\": \"get_due_card\", \"arguments\": {\"tags\": [\"bio\"]}}\n"
        "\n"
        "  --file PATH        data file (env FLASHCARDS_FILE, default ./flashcards.json)\n"
        "  --log-file PATH    log file (env FLASHCARDS_LOG_FILE, default flashcards.log)\n"
        "  --log-level LEVEL  trace|debug|info|warn|error|critical|off\n"
        "                     (env FLASHCARDS_LOG_LEVEL, default info)\n";
}
