#include "tinyftp/client/transfer_engine.hpp"

#include "tinyftp/error_codes.hpp"
#include "tinyftp/size_format.hpp"

namespace tinyftp::client
{

    std::string TransferProgress::render() const
    {
        return "[" + format_size(transferred) + " / " + format_size(total) + "]";
    }

    TransferEngine::TransferEngine(Channel &channel, Endpoint endpoint, Logger &logger, std::ostream &console,
                                   TransferOptions options)
        : channel_(channel),
          endpoint_(std::move(endpoint)),
          logger_(logger),
          console_(console),
          options_(std::move(options)) {}

    Status TransferEngine::show_list()
    {
        logger_.log("CMD", "Invoking Server Protocol 'LIST' command.");
        if (auto status = ensure_connected(); !status)
        {
            return status;
        }
        if (auto status = channel_.send(protocol::encode_request(protocol::Command::List)); !status)
        {
            return status;
        }

        std::string response;
        if (auto status = channel_.receive(protocol::kListResponseBytes, response); !status)
        {
            return status;
        }
        if (response.empty())
        {
            return Status::failure(ErrorCode::EmptyListing, "Server responded without a file list.");
        }
        logger_.log("OK!", "Server responded with:\n", response);
        return Status::success();
    }

    Status TransferEngine::ensure_connected()
    {
        if (channel_.connected())
        {
            return Status::success();
        }
        auto status = channel_.connect(endpoint_.host, endpoint_.port);
        if (status)
        {
            logger_.log("CON", "Successfully connected to server at: ", endpoint_.host, ':', endpoint_.port);
        }
        return status;
    }

    Status TransferEngine::server_error(const protocol::Response &response) const
    {
        const auto code = error_code_from_token(response.text).value_or(ErrorCode::UnexpectedResponse);
        return Status::failure(code, "Server response: \"" + response.text + "\" - " +
                                         std::string(protocol::describe(response.text)));
    }

    void TransferEngine::show_progress(std::string_view tag, std::string_view verb, const std::string &filename,
                                       const TransferProgress &progress)
    {
        console_ << '[' << tag << "] " << verb << " '" << filename << "' " << progress.render() << "\t\r"
                 << std::flush;
    }

    void TransferEngine::log_digest(const std::string &filename, crypto::TransferDigest &digest)
    {
        const auto bytes = digest.bytes();
        logger_.log("SUM", filename, " blake2b:", digest.finish(), " (", bytes, " bytes on the wire)");
    }

} // namespace tinyftp::client
