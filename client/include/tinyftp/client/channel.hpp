#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "tinyftp/status.hpp"

namespace tinyftp::client
{

    /**
     * A single byte-stream connection to the file server.
     *
     * send() writes the whole buffer before returning. receive() blocks until
     * at least one byte arrives and returns at most max_bytes; an empty result
     * means the peer closed the connection. send() and receive() fail with
     * ErrorCode::NotConnected unless connect() succeeded first.
     */
    class Channel
    {
    public:
        virtual ~Channel() = default;

        virtual Status connect(const std::string &host, std::uint16_t port) = 0;
        virtual Status send(std::string_view bytes) = 0;
        virtual Status receive(std::size_t max_bytes, std::string &out) = 0;
        virtual void close() noexcept = 0;
        virtual bool connected() const noexcept = 0;
    };

} // namespace tinyftp::client
