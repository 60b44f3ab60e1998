#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include "tinyftp/client/channel.hpp"

namespace tinyftp::client
{

    class TcpTransport : public Channel
    {
    public:
        TcpTransport();
        ~TcpTransport() override;

        TcpTransport(const TcpTransport &) = delete;
        TcpTransport &operator=(const TcpTransport &) = delete;

        Status connect(const std::string &host, std::uint16_t port) override;
        Status send(std::string_view bytes) override;
        Status receive(std::size_t max_bytes, std::string &out) override;
        void close() noexcept override;
        bool connected() const noexcept override;

    private:
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        bool connected_{false};
    };

} // namespace tinyftp::client
