#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // stdout carries tool responses, so the only sink is the log file
    inline void init(const std::string& path, spdlog::level::level_enum level)
    {
        auto file_logger = spdlog::basic_logger_mt("file_logger", path);

        spdlog::set_default_logger(file_logger);

        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }
}
