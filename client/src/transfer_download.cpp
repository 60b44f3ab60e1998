#include "tinyftp/client/transfer_engine.hpp"

#include <fstream>
#include <system_error>

#include "tinyftp/error_codes.hpp"

namespace tinyftp::client
{

    Status TransferEngine::get_file(const std::string &filename)
    {
        logger_.log("CMD", "Invoking Server Protocol 'GET' command with filename: ", filename);

        const auto path = options_.working_directory / filename;
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
        {
            if (!options_.overwrite_existing)
            {
                return Status::failure(ErrorCode::FileAlreadyExists,
                                       "FileAlreadyExists: " +
                                           std::string(protocol::describe("FileAlreadyExists")) + " (client).");
            }
            logger_.log("WRN", "'", filename, "' already exists locally and will be overwritten.");
        }

        if (auto status = ensure_connected(); !status)
        {
            return status;
        }
        if (auto status = channel_.send(protocol::encode_request(protocol::Command::Get, filename)); !status)
        {
            return status;
        }

        std::uint64_t file_size = 0;
        if (auto status = receive_file_size(filename, file_size); !status)
        {
            return status;
        }
        return stream_download(filename, path, file_size);
    }

    // The size reply may be preceded by one informational token.
    Status TransferEngine::receive_file_size(const std::string &filename, std::uint64_t &file_size)
    {
        std::string reply;
        if (auto status = channel_.receive(protocol::kGetSizeResponseBytes, reply); !status)
        {
            return status;
        }

        auto response = protocol::classify(reply);
        if (response.kind == protocol::ResponseKind::Error)
        {
            return server_error(response);
        }
        if (response.kind == protocol::ResponseKind::Info)
        {
            logger_.log("OK!", "Server response: \"", response.text, "\" - ", protocol::describe(response.text));
            if (auto status = channel_.receive(protocol::kGetSizeResponseBytes, reply); !status)
            {
                return status;
            }
            response = protocol::classify(reply);
        }

        if (reply.empty())
        {
            return Status::failure(ErrorCode::UnexpectedResponse,
                                   "Server closed the connection without sending the size of '" + filename + "'");
        }
        const auto size = response.kind == protocol::ResponseKind::Raw ? protocol::parse_size(reply) : std::nullopt;
        if (!size)
        {
            return Status::failure(ErrorCode::UnexpectedResponse,
                                   "Unexpected server response to GET: \"" + reply + "\"");
        }
        file_size = *size;
        return Status::success();
    }

    // Chunks are written whole, so a final chunk that runs past the announced
    // size is kept in full.
    Status TransferEngine::stream_download(const std::string &filename, const std::filesystem::path &path,
                                           std::uint64_t file_size)
    {
        std::ofstream download(path, std::ios::binary | std::ios::trunc);
        if (!download.is_open())
        {
            return Status::failure(ErrorCode::LocalIo, "Could not create '" + path.string() + "'");
        }

        TransferProgress progress{.transferred = 0, .total = file_size};
        crypto::TransferDigest digest;
        std::string chunk;
        while (!progress.complete())
        {
            if (auto status = channel_.receive(protocol::kChunkSize, chunk); !status)
            {
                return status;
            }
            if (chunk.empty())
            {
                return Status::failure(ErrorCode::TransportFailed, "Connection closed by server after " +
                                                                       std::to_string(progress.transferred) + " of " +
                                                                       std::to_string(file_size) + " bytes of '" +
                                                                       filename + "'");
            }
            download.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            if (!download)
            {
                return Status::failure(ErrorCode::LocalIo, "Failed to write to '" + path.string() + "'");
            }
            digest.update(chunk);
            progress.advance(chunk.size());
            show_progress("DWN", "Downloading", filename, progress);
        }

        download.close();
        if (!download)
        {
            return Status::failure(ErrorCode::LocalIo, "Failed to finalize '" + path.string() + "'");
        }
        logger_.log("DWN", "Download Complete '", filename, "' ", progress.render());
        logger_.log("OK!", "File saved to: ", path.string());
        log_digest(filename, digest);
        return Status::success();
    }

} // namespace tinyftp::client
