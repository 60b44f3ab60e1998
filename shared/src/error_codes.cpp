#include "tinyftp/error_codes.hpp"

#include <array>

namespace tinyftp
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 14> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::ConnectionFailed, "connection_failed"},
            {ErrorCode::NotConnected, "not_connected"},
            {ErrorCode::TransportFailed, "transport_failed"},
            {ErrorCode::FileAlreadyExists, "file_already_exists"},
            {ErrorCode::FileNotFound, "file_not_found"},
            {ErrorCode::FileTooLarge, "file_too_large"},
            {ErrorCode::FileZeroSized, "file_zero_sized"},
            {ErrorCode::FileNameTooLong, "file_name_too_long"},
            {ErrorCode::FileIsDirectory, "file_is_directory"},
            {ErrorCode::UnexpectedResponse, "unexpected_response"},
            {ErrorCode::EmptyListing, "empty_listing"},
            {ErrorCode::LocalIo, "local_io"},
        }};

        struct TokenCode
        {
            std::string_view token;
            ErrorCode code;
        };

        constexpr std::array<TokenCode, 6> kTokenCodes{{
            {"FileAlreadyExists", ErrorCode::FileAlreadyExists},
            {"FileNotFound", ErrorCode::FileNotFound},
            {"FileTooLarge", ErrorCode::FileTooLarge},
            {"FileZeroSized", ErrorCode::FileZeroSized},
            {"FileNameTooLong", ErrorCode::FileNameTooLong},
            {"FileIsDirectory", ErrorCode::FileIsDirectory},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::optional<ErrorCode> error_code_from_token(std::string_view token) noexcept
    {
        for (const auto &entry : kTokenCodes)
        {
            if (entry.token == token)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

    std::string_view to_token(ErrorCode code) noexcept
    {
        for (const auto &entry : kTokenCodes)
        {
            if (entry.code == code)
            {
                return entry.token;
            }
        }
        return {};
    }

} // namespace tinyftp
