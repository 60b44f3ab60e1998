#pragma once

#include <string>
#include <variant>

namespace tinyftp::client
{

    struct PutCommand
    {
        std::string filename;

        bool operator==(const PutCommand &) const = default;
    };

    struct GetCommand
    {
        std::string filename;

        bool operator==(const GetCommand &) const = default;
    };

    struct ListCommand
    {
        bool operator==(const ListCommand &) const = default;
    };

    using CommandRequest = std::variant<PutCommand, GetCommand, ListCommand>;

} // namespace tinyftp::client
