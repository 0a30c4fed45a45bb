#include "GameServer.hpp"
#include "GameListener.hpp"
#include "GameRoom.hpp"
#include "GameSession.hpp"
#include "Protocol.hpp"
#include "RoomDirectory.hpp"
#include "spdlog/spdlog.h"
#include <fmt/format.h>

#include <chrono>
#include <memory>
#include <utility>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
namespace beast = boost::beast;

//------------------------------------------------------------------------------
// GameServer Implementation
//------------------------------------------------------------------------------
GameServer::GameServer(net::io_context &ioc, ServerConfig config)
    : ioc_(ioc),
      config_(std::move(config)),
      directory_(std::make_shared<RoomDirectory>(ioc.get_executor(), config_.game_over_linger)),
      reap_timer_(ioc)
{
    spdlog::info("[GameServer {}] Initializing for {}:{}", fmt::ptr(this), config_.bind_ip, config_.port);
}

GameServer::~GameServer()
{
    spdlog::debug("[GameServer {}] Destructor called.", fmt::ptr(this));
}

void GameServer::run()
{
    if (stopped_.load())
    {
        spdlog::error("[GameServer {}] Cannot run, server is already stopped.", fmt::ptr(this));
        return;
    }

    auto address = net::ip::make_address(config_.bind_ip);
    listener_ = std::make_shared<GameListener>(ioc_, tcp::endpoint{address, config_.port}, shared_from_this());
    port_ = listener_->local_port();
    listener_->run();

    schedule_reap();

    spdlog::info("[GameServer {}] Server startup sequence complete. Listening on port {}", fmt::ptr(this), port_.load());
}

void GameServer::stop()
{
    if (stopped_.exchange(true))
    {
        return;
    }
    spdlog::info("[GameServer {}] Stopping server...", fmt::ptr(this));

    net::post(ioc_, [self = shared_from_this()]() {
        if (self->listener_)
        {
            self->listener_->stop();
            self->listener_.reset();
        }
        self->reap_timer_.cancel();
        self->directory_->close_all();
        spdlog::info("[GameServer {}] Server stop sequence complete.", fmt::ptr(self.get()));
    });
}

unsigned short GameServer::port() const
{
    return port_.load();
}

void GameServer::handle_handshake(const std::shared_ptr<GameSession>& session, const std::string& line)
{
    auto handshake = protocol::parse_handshake(line);
    if (!handshake || stopped_.load())
    {
        spdlog::warn("[GameServer {}] Rejecting handshake '{}' from {}.", fmt::ptr(this), line, session->remote_id());
        if (!session->deliver(protocol::kProtocolError))
        {
            spdlog::debug("[GameServer {}] Session {} already closed.", fmt::ptr(this), session->remote_id());
        }
        session->close();
        return;
    }

    if (handshake->mode == protocol::JoinMode::Player)
    {
        auto join = directory_->join_as_player(handshake->code, session);
        if (join.room)
        {
            session->attach_room(std::move(join.room));
        }
    }
    else
    {
        if (auto room = directory_->join_as_spectator(handshake->code, session))
        {
            session->attach_room(std::move(room));
        }
    }
}

void GameServer::schedule_reap()
{
    reap_timer_.expires_after(config_.room_reap_interval);
    reap_timer_.async_wait(
        [self = shared_from_this()](beast::error_code ec) { self->on_reap(ec); });
}

/**
 * @details 플레이어가 없고 게임이 시작되지 않은 채 오래 남아 있는 방(관전자만 있는 방,
 *          대기 플레이어가 떠난 방)을 정리하고 다음 검사를 예약합니다.
 */
void GameServer::on_reap(beast::error_code ec)
{
    if (ec == net::error::operation_aborted || stopped_.load())
    {
        return;
    }
    if (ec)
    {
        spdlog::warn("[GameServer {}] Reap timer error: {}", fmt::ptr(this), ec.message());
    }
    else
    {
        std::size_t reaped = directory_->reap_idle(std::chrono::steady_clock::now(), config_.room_idle_timeout);
        spdlog::debug("[GameServer {}] Reap pass: {} removed, {} room(s) active.", fmt::ptr(this), reaped, directory_->size());
    }
    schedule_reap();
}
