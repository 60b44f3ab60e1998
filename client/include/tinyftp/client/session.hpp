#pragma once

#include <iostream>
#include <ostream>

#include "tinyftp/client/channel.hpp"
#include "tinyftp/client/config.hpp"
#include "tinyftp/client/logger.hpp"
#include "tinyftp/status.hpp"

namespace tinyftp::client
{

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger &logger, Channel &channel, std::ostream &console = std::cout,
                      std::ostream &errors = std::cerr);

        // Runs the configured command and returns the process exit status.
        int run();

        Status execute();

    private:
        void disconnect() noexcept;

        ClientConfig config_;
        Logger &logger_;
        Channel &channel_;
        std::ostream &console_;
        std::ostream &errors_;
    };

} // namespace tinyftp::client
