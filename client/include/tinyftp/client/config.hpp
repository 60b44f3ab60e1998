#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "tinyftp/client/command.hpp"

namespace tinyftp::client
{

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        CommandRequest command{ListCommand{}};
        std::filesystem::path log_path{"client.log"};
        bool overwrite_existing{false};
        bool quiet{false};
    };

    // Throws std::runtime_error describing the first invalid argument.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(std::string_view program_name);

} // namespace tinyftp::client
