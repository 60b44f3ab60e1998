#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "tinyftp/client/channel.hpp"
#include "tinyftp/client/logger.hpp"
#include "tinyftp/crypto.hpp"
#include "tinyftp/protocol.hpp"
#include "tinyftp/status.hpp"

namespace tinyftp::client
{

    struct Endpoint
    {
        std::string host;
        std::uint16_t port{};
    };

    struct TransferOptions
    {
        std::filesystem::path working_directory;
        // GET replaces an existing local file instead of failing.
        bool overwrite_existing{false};
    };

    struct TransferProgress
    {
        std::uint64_t transferred{};
        std::uint64_t total{};

        void advance(std::size_t bytes) noexcept
        {
            transferred += bytes;
        }

        bool complete() const noexcept
        {
            return transferred >= total;
        }

        // "[<transferred> / <total>]" with both sides in human readable units.
        std::string render() const;
    };

    /**
     * Runs the PUT, GET and LIST flows over a Channel. The channel is connected
     * lazily by each flow; tearing it down is left to the owner. Local paths
     * resolve against options.working_directory, which must be set.
     */
    class TransferEngine
    {
    public:
        TransferEngine(Channel &channel, Endpoint endpoint, Logger &logger, std::ostream &console,
                       TransferOptions options);

        Status put_file(const std::string &filename);
        Status get_file(const std::string &filename);
        Status show_list();

    private:
        Status ensure_connected();
        Status validate_upload(const std::string &filename, std::uint64_t &file_size) const;
        Status reject_upload(ErrorCode code);
        Status stream_upload(const std::string &filename, const std::filesystem::path &path, std::uint64_t file_size);
        Status receive_file_size(const std::string &filename, std::uint64_t &file_size);
        Status stream_download(const std::string &filename, const std::filesystem::path &path, std::uint64_t file_size);

        Status server_error(const protocol::Response &response) const;
        void show_progress(std::string_view tag, std::string_view verb, const std::string &filename,
                           const TransferProgress &progress);
        void log_digest(const std::string &filename, crypto::TransferDigest &digest);

        Channel &channel_;
        Endpoint endpoint_;
        Logger &logger_;
        std::ostream &console_;
        TransferOptions options_;
    };

} // namespace tinyftp::client
