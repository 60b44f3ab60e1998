#include "tinyftp/client/transfer_engine.hpp"

#include <fstream>
#include <system_error>
#include <vector>

#include "tinyftp/error_codes.hpp"

namespace tinyftp::client
{

    Status TransferEngine::put_file(const std::string &filename)
    {
        logger_.log("CMD", "Invoking Server Protocol 'PUT' command with filename: ", filename);

        std::uint64_t file_size = 0;
        if (auto status = validate_upload(filename, file_size); !status)
        {
            return reject_upload(status.code());
        }

        logger_.log("OK!", "File '", filename, "' found in client directory. Sending server total file-size.");
        if (auto status = ensure_connected(); !status)
        {
            return status;
        }
        if (auto status = channel_.send(protocol::encode_request(protocol::Command::Put, filename)); !status)
        {
            return status;
        }

        std::string reply;
        if (auto status = channel_.receive(protocol::kPutReadyResponseBytes, reply); !status)
        {
            return status;
        }
        const auto response = protocol::classify(reply);
        switch (response.kind)
        {
        case protocol::ResponseKind::Error:
            return server_error(response);
        case protocol::ResponseKind::Info:
            return stream_upload(filename, options_.working_directory / filename, file_size);
        case protocol::ResponseKind::Raw:
            break;
        }
        if (reply.empty())
        {
            return Status::failure(ErrorCode::UnexpectedResponse, "Server closed the connection without answering PUT");
        }
        return Status::failure(ErrorCode::UnexpectedResponse, "Unexpected server response to PUT: \"" + reply + "\"");
    }

    // Stops at the first failing check. Names over 255 chars are reported as
    // FileNameTooLong even though they can never exist on disk.
    Status TransferEngine::validate_upload(const std::string &filename, std::uint64_t &file_size) const
    {
        if (filename.size() > protocol::kMaxFileNameLength)
        {
            return Status::failure(ErrorCode::FileNameTooLong, filename);
        }

        const auto path = options_.working_directory / filename;
        std::error_code ec;
        const bool plain_name = std::filesystem::path(filename).filename().string() == filename;
        if (!plain_name || !std::filesystem::exists(path, ec) || ec)
        {
            return Status::failure(ErrorCode::FileNotFound, filename);
        }
        if (std::filesystem::is_directory(path, ec))
        {
            return Status::failure(ErrorCode::FileIsDirectory, filename);
        }

        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            return Status::failure(ErrorCode::FileNotFound, filename);
        }
        if (size > protocol::kMaxFileSize)
        {
            return Status::failure(ErrorCode::FileTooLarge, filename);
        }
        if (size == 0)
        {
            return Status::failure(ErrorCode::FileZeroSized, filename);
        }
        file_size = size;
        return Status::success();
    }

    Status TransferEngine::reject_upload(ErrorCode code)
    {
        const auto token = to_token(code);

        // Notifying the peer is best effort; the local error is returned either way.
        auto notified = ensure_connected();
        if (notified)
        {
            notified = channel_.send(token);
        }
        if (!notified)
        {
            logger_.log("WRN", "Could not notify server of ", token, ": ", notified.message());
        }

        return Status::failure(code, std::string(token) + ": " + std::string(protocol::describe(token)));
    }

    Status TransferEngine::stream_upload(const std::string &filename, const std::filesystem::path &path,
                                         std::uint64_t file_size)
    {
        std::ifstream upload(path, std::ios::binary);
        if (!upload.is_open())
        {
            return Status::failure(ErrorCode::LocalIo, "Could not open '" + filename + "' for reading");
        }

        if (auto status = channel_.send(std::to_string(file_size)); !status)
        {
            return status;
        }

        TransferProgress progress{.transferred = 0, .total = file_size};
        crypto::TransferDigest digest;
        std::vector<char> buffer(protocol::kChunkSize);
        while (upload)
        {
            upload.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(upload.gcount());
            if (read_count == 0)
            {
                break;
            }
            progress.advance(read_count);
            show_progress("UPL", "Uploading", filename, progress);
            const std::string_view chunk(buffer.data(), read_count);
            if (auto status = channel_.send(chunk); !status)
            {
                return status;
            }
            digest.update(chunk);
        }
        if (upload.bad())
        {
            return Status::failure(ErrorCode::LocalIo, "Failed while reading '" + filename + "'");
        }

        logger_.log("UPL", "Upload Complete '", filename, "' ", progress.render());
        log_digest(filename, digest);
        return Status::success();
    }

} // namespace tinyftp::client
