#include "tinyftp/protocol.hpp"

#include <array>
#include <cctype>
#include <limits>

namespace tinyftp::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
            bool user_selectable;
        };

        constexpr std::array<CommandMapping, 4> kCommandMappings{{
            {Command::Put, "PUT", true},
            {Command::Get, "GET", true},
            {Command::List, "LIST", true},
            {Command::Disconnect, "DISCONNECT", false},
        }};

        struct TokenDescription
        {
            std::string_view token;
            std::string_view description;
        };

        constexpr std::array<TokenDescription, 6> kErrorTokens{{
            {"FileAlreadyExists", "File already exists in current directory"},
            {"FileNotFound", "File could not be found in current directory"},
            {"FileTooLarge", "File is too large to transfer (over 5GB in size)"},
            {"FileZeroSized", "File is a zero-sized file (does not contain data)"},
            {"FileNameTooLong", "Filename of file is too long (over 255 chars)"},
            {"FileIsDirectory", "File is actually a directory (folder containing files)"},
        }};

        constexpr std::array<TokenDescription, 2> kInfoTokens{{
            {"FileOkTransfer", "No existing file present, OK to create new file."},
            {"FileSizeReceived", "The filesize of file being transferred has successfully been received."},
        }};

        template <std::size_t N>
        const TokenDescription *find_token(const std::array<TokenDescription, N> &table, std::string_view token) noexcept
        {
            for (const auto &entry : table)
            {
                if (entry.token == token)
                {
                    return &entry;
                }
            }
            return nullptr;
        }

        bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept
        {
            if (lhs.size() != rhs.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < lhs.size(); ++i)
            {
                if (std::toupper(static_cast<unsigned char>(lhs[i])) != std::toupper(static_cast<unsigned char>(rhs[i])))
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.user_selectable && equals_ignore_case(mapping.label, value))
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string encode_request(Command command, std::string_view filename)
    {
        std::string request(to_string(command));
        if (command == Command::Put || command == Command::Get)
        {
            request.push_back(' ');
            request.append(filename);
        }
        return request;
    }

    Response classify(std::string_view response_text)
    {
        if (is_error_token(response_text))
        {
            return Response{.kind = ResponseKind::Error, .text = std::string(response_text)};
        }
        if (is_info_token(response_text))
        {
            return Response{.kind = ResponseKind::Info, .text = std::string(response_text)};
        }
        return Response{.kind = ResponseKind::Raw, .text = std::string(response_text)};
    }

    bool is_error_token(std::string_view token) noexcept
    {
        return find_token(kErrorTokens, token) != nullptr;
    }

    bool is_info_token(std::string_view token) noexcept
    {
        return find_token(kInfoTokens, token) != nullptr;
    }

    std::string_view describe(std::string_view token) noexcept
    {
        if (const auto *entry = find_token(kErrorTokens, token))
        {
            return entry->description;
        }
        if (const auto *entry = find_token(kInfoTokens, token))
        {
            return entry->description;
        }
        return {};
    }

    std::optional<std::uint64_t> parse_size(std::string_view text) noexcept
    {
        if (text.empty())
        {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
        for (const char ch : text)
        {
            if (ch < '0' || ch > '9')
            {
                return std::nullopt;
            }
            const auto digit = static_cast<std::uint64_t>(ch - '0');
            if (value > (kMax - digit) / 10)
            {
                return std::nullopt;
            }
            value = value * 10 + digit;
        }
        return value;
    }

} // namespace tinyftp::protocol
