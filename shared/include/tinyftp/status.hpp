/**
 * TinyFTP - Result of a transport call or a transfer flow.
 */
#pragma once

#include <string>
#include <utility>

#include "tinyftp/error_codes.hpp"

namespace tinyftp
{

    class Status
    {
    public:
        Status() = default;

        static Status success()
        {
            return Status{};
        }

        static Status failure(ErrorCode code, std::string message)
        {
            return Status{code, std::move(message)};
        }

        bool ok() const noexcept
        {
            return code_ == ErrorCode::Ok;
        }

        explicit operator bool() const noexcept
        {
            return ok();
        }

        ErrorCode code() const noexcept
        {
            return code_;
        }

        const std::string &message() const noexcept
        {
            return message_;
        }

    private:
        Status(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

        ErrorCode code_{ErrorCode::Ok};
        std::string message_;
    };

} // namespace tinyftp
