/**
 * @file GameServer.hpp
 * @brief TicTacToe 게임 서버의 최상위 객체 `GameServer`를 정의합니다.
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>

#include "ServerConfig.hpp"

// Forward declarations
class GameListener;
class GameSession;
class RoomDirectory;

namespace net = boost::asio;
namespace beast = boost::beast;

/**
 * @class GameServer
 * @brief 리스너, 방 디렉터리, 유휴 방 회수 타이머를 소유하는 서버 객체.
 * @details 새 연결의 핸드셰이크를 해석하여 플레이어 또는 관전자로 방에 배정합니다.
 *          `GameSession`이 서버를 `shared_ptr`로 잡고 있으므로 반드시 `std::make_shared`로 생성해야 합니다.
 */
class GameServer : public std::enable_shared_from_this<GameServer>
{
public:
    /**
     * @brief GameServer 생성자.
     * @param ioc 모든 비동기 작업에 사용할 io_context.
     * @param config 서버 설정.
     */
    GameServer(net::io_context& ioc, ServerConfig config);
    ~GameServer();

    /**
     * @brief 리스너를 열고 accept 루프와 방 회수 타이머를 시작합니다.
     * @throw std::system_error 바인드 등 리스너 설정에 실패한 경우.
     */
    void run();

    /**
     * @brief 서버를 중지합니다.
     * @details 리스너를 닫고 회수 타이머를 취소한 뒤 모든 방의 연결을 닫습니다. 여러 번 호출해도 안전합니다.
     */
    void stop();

    /// @brief 실제로 리슨 중인 포트. run() 전이거나 실패했으면 0.
    unsigned short port() const;

    const ServerConfig& config() const { return config_; }
    std::shared_ptr<RoomDirectory> directory() const { return directory_; }

    /**
     * @brief 새 연결의 첫 메시지를 처리합니다.
     * @details `ROOM <code>`는 플레이어 입장, `SPECTATE <code>`는 관전자 입장으로 처리하고,
     *          그 외의 메시지에는 `Protocol Error`를 보낸 뒤 연결을 닫습니다.
     *          세션의 strand 위에서 호출됩니다.
     */
    void handle_handshake(const std::shared_ptr<GameSession>& session, const std::string& line);

private:
    void schedule_reap();
    void on_reap(beast::error_code ec);

    net::io_context& ioc_;
    ServerConfig config_;
    std::shared_ptr<RoomDirectory> directory_;
    std::shared_ptr<GameListener> listener_;
    net::steady_timer reap_timer_;
    std::atomic<unsigned short> port_{0};
    std::atomic<bool> stopped_{false};
};
