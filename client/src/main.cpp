#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "tinyftp/client/config.hpp"
#include "tinyftp/client/logger.hpp"
#include "tinyftp/client/session.hpp"
#include "tinyftp/client/tcp_transport.hpp"
#include "tinyftp/version.hpp"

int main(int argc, char *argv[])
{
    using tinyftp::client::ClientConfig;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            std::cout << "TinyFTP client " << tinyftp::version() << "\n"
                      << tinyftp::client::usage(argv[0]);
            return EXIT_SUCCESS;
        }
    }

    ClientConfig config;
    try
    {
        config = tinyftp::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "[ERR] " << ex.what() << std::endl;
        std::cerr << tinyftp::client::usage(argv[0]);
        return EXIT_FAILURE;
    }

    tinyftp::client::Logger logger(config.log_path, !config.quiet);
    tinyftp::client::TcpTransport transport;
    tinyftp::client::ClientSession session(std::move(config), logger, transport);
    return session.run() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
