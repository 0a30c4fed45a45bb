#include "GameListener.hpp"
#include "GameServer.hpp"
#include "GameSession.hpp"
#include "spdlog/spdlog.h"
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <string>
#include <system_error> // For std::system_error

namespace net = boost::asio;
using tcp = net::ip::tcp;
namespace beast = boost::beast;

//------------------------------------------------------------------------------
// GameListener Implementation
//------------------------------------------------------------------------------
GameListener::GameListener(
    net::io_context &ioc,
    tcp::endpoint endpoint,
    std::shared_ptr<GameServer> server)
    : ioc_(ioc),
      acceptor_(net::make_strand(ioc)),
      server_(std::move(server))
{
    const std::string where = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());

    // 단계별로 실패하면 acceptor를 닫고 어느 단계에서 실패했는지 남긴 뒤 예외를 던진다.
    auto check = [this, &where](const char* step, const beast::error_code& ec) {
        if (!ec)
            return;
        spdlog::error("[GameListener] Cannot {} {}: {}", step, where, ec.message());
        beast::error_code ignored;
        acceptor_.close(ignored);
        throw std::system_error{ec};
    };

    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    check("open acceptor for", ec);
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    check("set SO_REUSEADDR on", ec);
    acceptor_.bind(endpoint, ec);
    check("bind", ec);
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    check("listen on", ec);

    spdlog::info("[GameListener] Accepting game clients on {} (port {})", where, local_port());
}

void GameListener::run()
{
    if (!acceptor_.is_open())
    {
        spdlog::error("[GameListener] Acceptor not open. Cannot run.");
        return;
    }
    do_accept();
}

void GameListener::stop()
{
    net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec)
        {
            spdlog::warn("[GameListener] Acceptor close error: {}", ec.message());
        }
        else
        {
            spdlog::info("[GameListener] Acceptor closed.");
        }
    });
}

unsigned short GameListener::local_port() const
{
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void GameListener::do_accept()
{
    if (!acceptor_.is_open())
        return;

    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&GameListener::on_accept, shared_from_this()));
}

void GameListener::on_accept(beast::error_code ec, tcp::socket socket)
{
    if (!acceptor_.is_open())
    {
        spdlog::debug("[GameListener] Accept completed after shutdown; dropping.");
        return;
    }

    if (ec == net::error::operation_aborted)
    {
        return;
    }
    if (ec)
    {
        // 일시적인 오류(fd 부족, 연결 초기화 등)는 기록만 하고 계속 받는다.
        spdlog::warn("[GameListener] Accept failed: {}", ec.message());
    }
    else
    {
        beast::error_code peer_ec;
        auto peer = socket.remote_endpoint(peer_ec);
        if (peer_ec)
        {
            spdlog::debug("[GameListener] Client vanished before session start: {}", peer_ec.message());
        }
        else
        {
            spdlog::debug("[GameListener] New client {}:{}", peer.address().to_string(), peer.port());
            std::make_shared<GameSession>(std::move(socket), server_)->start();
        }
    }

    do_accept();
}
