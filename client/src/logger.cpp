#include "tinyftp/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>

namespace tinyftp::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path, bool echo_to_console)
    {
        if (echo_to_console)
        {
            console_ = std::make_shared<spdlog::logger>(
                "console", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            console_->set_pattern("%v");
            console_->set_level(spdlog::level::info);
        }

        if (!path)
        {
            return;
        }
        try
        {
            file_ = std::make_shared<spdlog::logger>(
                "client", std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
            file_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            file_->set_level(spdlog::level::info);
            file_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            file_.reset();
            std::cerr << "[WRN] Logging to console only, cannot open " << path->string() << ": " << ex.what()
                      << std::endl;
        }
    }

} // namespace tinyftp::client
