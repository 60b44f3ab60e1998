#include "tinyftp/client/session.hpp"

#include <exception>
#include <filesystem>
#include <type_traits>
#include <variant>

#include "tinyftp/client/transfer_engine.hpp"
#include "tinyftp/error_codes.hpp"
#include "tinyftp/protocol.hpp"

namespace tinyftp::client
{

    ClientSession::ClientSession(ClientConfig config, Logger &logger, Channel &channel, std::ostream &console,
                                 std::ostream &errors)
        : config_(std::move(config)),
          logger_(logger),
          channel_(channel),
          console_(console),
          errors_(errors) {}

    int ClientSession::run()
    {
        logger_.log("OK!", "Client startup initialised.");

        Status status;
        try
        {
            status = execute();
        }
        catch (const std::exception &ex)
        {
            disconnect();
            status = Status::failure(ErrorCode::LocalIo, ex.what());
        }

        if (!status)
        {
            logger_.error("ERR", status.message(), " (", to_string(status.code()), ")");
            errors_ << "[ERR] " << status.message() << std::endl;
            return 1;
        }
        return 0;
    }

    Status ClientSession::execute()
    {
        TransferEngine engine(channel_, Endpoint{.host = config_.host, .port = config_.port}, logger_, console_,
                              TransferOptions{
                                  .working_directory = std::filesystem::current_path(),
                                  .overwrite_existing = config_.overwrite_existing,
                              });

        auto status = std::visit(
            [&engine](const auto &command)
            {
                using T = std::decay_t<decltype(command)>;
                if constexpr (std::is_same_v<T, PutCommand>)
                {
                    return engine.put_file(command.filename);
                }
                else if constexpr (std::is_same_v<T, GetCommand>)
                {
                    return engine.get_file(command.filename);
                }
                else
                {
                    return engine.show_list();
                }
            },
            config_.command);

        disconnect();
        return status;
    }

    void ClientSession::disconnect() noexcept
    {
        if (!channel_.connected())
        {
            return;
        }
        // A failed DISCONNECT is not reported.
        const auto status = channel_.send(tinyftp::protocol::encode_request(tinyftp::protocol::Command::Disconnect));
        channel_.close();
        if (status)
        {
            logger_.log("DIS", "Disconnected from server.");
        }
    }

} // namespace tinyftp::client
