#include "tinyftp/client/tcp_transport.hpp"

#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

namespace tinyftp::client
{

    TcpTransport::TcpTransport() : socket_(io_context_) {}

    TcpTransport::~TcpTransport()
    {
        close();
    }

    Status TcpTransport::connect(const std::string &host, std::uint16_t port)
    {
        const auto failure = [&](const std::error_code &ec)
        {
            close();
            return Status::failure(ErrorCode::ConnectionFailed, "An error occurred when connecting to host " + host +
                                                                    ":" + std::to_string(port) + "\n" + ec.message());
        };

        std::error_code ec;
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host, std::to_string(port), ec);
        if (ec)
        {
            return failure(ec);
        }
        asio::connect(socket_, results, ec);
        if (ec)
        {
            return failure(ec);
        }
        connected_ = true;
        return Status::success();
    }

    Status TcpTransport::send(std::string_view bytes)
    {
        if (!connected_)
        {
            return Status::failure(ErrorCode::NotConnected, "Cannot send: not connected to a server");
        }
        std::error_code ec;
        asio::write(socket_, asio::buffer(bytes.data(), bytes.size()), ec);
        if (ec)
        {
            return Status::failure(ErrorCode::TransportFailed, "Failed to send to server: " + ec.message());
        }
        return Status::success();
    }

    Status TcpTransport::receive(std::size_t max_bytes, std::string &out)
    {
        out.clear();
        if (!connected_)
        {
            return Status::failure(ErrorCode::NotConnected, "Cannot receive: not connected to a server");
        }
        out.resize(max_bytes);
        std::error_code ec;
        const auto count = socket_.read_some(asio::buffer(out.data(), out.size()), ec);
        if (ec == asio::error::eof)
        {
            out.clear();
            return Status::success();
        }
        if (ec)
        {
            out.clear();
            return Status::failure(ErrorCode::TransportFailed, "Failed to receive from server: " + ec.message());
        }
        out.resize(count);
        return Status::success();
    }

    void TcpTransport::close() noexcept
    {
        connected_ = false;
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    bool TcpTransport::connected() const noexcept
    {
        return connected_;
    }

} // namespace tinyftp::client
