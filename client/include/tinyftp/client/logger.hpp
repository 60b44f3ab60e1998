#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace tinyftp::client
{

    /**
     * Category-tagged event log. Every entry is appended to the log file with
     * a timestamp; info entries are also echoed to the console unless the
     * console echo is disabled.
     */
    class Logger
    {
    public:
        Logger(const std::optional<std::filesystem::path> &path, bool echo_to_console);

        template <typename... Args>
        void log(const std::string &tag, Args &&...args)
        {
            const auto line = format_line(tag, std::forward<Args>(args)...);
            if (file_)
            {
                file_->info("{}", line);
            }
            if (console_)
            {
                console_->info("{}", line);
            }
        }

        // Errors only go to the log file; the caller reports them on stderr.
        template <typename... Args>
        void error(const std::string &tag, Args &&...args)
        {
            if (file_)
            {
                file_->error("{}", format_line(tag, std::forward<Args>(args)...));
            }
        }

    private:
        template <typename... Args>
        static std::string format_line(const std::string &tag, Args &&...args)
        {
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            return "[" + tag + "] " + std::string(buf.data(), buf.size());
        }

        std::shared_ptr<spdlog::logger> file_;
        std::shared_ptr<spdlog::logger> console_;
    };

} // namespace tinyftp::client
