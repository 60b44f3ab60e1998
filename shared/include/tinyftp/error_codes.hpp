/**
 * TinyFTP - Error codes shared by the codec, transport and transfer flows.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tinyftp
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        ConnectionFailed = 2,
        NotConnected = 3,
        TransportFailed = 4,
        FileAlreadyExists = 5,
        FileNotFound = 6,
        FileTooLarge = 7,
        FileZeroSized = 8,
        FileNameTooLong = 9,
        FileIsDirectory = 10,
        UnexpectedResponse = 11,
        EmptyListing = 12,
        LocalIo = 13
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // Maps a protocol error token (e.g. "FileNotFound") to its code.
    std::optional<ErrorCode> error_code_from_token(std::string_view token) noexcept;

    // Protocol error token for a file error code, empty for other codes.
    std::string_view to_token(ErrorCode code) noexcept;

} // namespace tinyftp
