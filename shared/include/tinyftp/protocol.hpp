/**
 * TinyFTP - Wire vocabulary: request lines, error/informational tokens
 * and classification of raw server responses.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tinyftp::protocol
{

    // Chunk size used when streaming file contents in either direction.
    constexpr std::size_t kChunkSize = 4096;
    constexpr std::size_t kMaxFileNameLength = 255;
    constexpr std::uint64_t kMaxFileSize = 5368709120ULL;

    // Receive limits for the single-read responses of each flow.
    constexpr std::size_t kPutReadyResponseBytes = 24;
    constexpr std::size_t kGetSizeResponseBytes = 1024;
    constexpr std::size_t kListResponseBytes = 16384;

    enum class Command : std::uint8_t
    {
        Put,
        Get,
        List,
        Disconnect
    };

    std::string_view to_string(Command command) noexcept;

    // Accepts the user-facing command names put/get/list in any letter case.
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    std::string encode_request(Command command, std::string_view filename = {});

    enum class ResponseKind : std::uint8_t
    {
        Error,
        Info,
        Raw
    };

    struct Response
    {
        ResponseKind kind{ResponseKind::Raw};
        std::string text{};

        bool operator==(const Response &) const = default;
    };

    Response classify(std::string_view response_text);

    bool is_error_token(std::string_view token) noexcept;
    bool is_info_token(std::string_view token) noexcept;

    // Human readable description of an error or informational token, empty
    // when the token is not part of either table.
    std::string_view describe(std::string_view token) noexcept;

    std::optional<std::uint64_t> parse_size(std::string_view text) noexcept;

} // namespace tinyftp::protocol
