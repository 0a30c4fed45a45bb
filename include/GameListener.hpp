// include/GameListener.hpp
#pragma once

#include <memory>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/error.hpp> // For beast::error_code

// Forward declarations
class GameServer;
namespace net = boost::asio;
using tcp = net::ip::tcp;
namespace beast = boost::beast;

/**
 * @class GameListener
 * @brief 들어오는 게임 클라이언트 연결을 수락하고 GameSession을 생성.
 */
class GameListener : public std::enable_shared_from_this<GameListener>
{
    /// @brief 비동기 I/O 작업을 위한 io_context.
    net::io_context& ioc_;
    /// @brief 들어오는 연결을 수락하는 acceptor.
    tcp::acceptor acceptor_;
    /// @brief GameServer의 공유 포인터. 세션 생성 시 필요.
    std::shared_ptr<GameServer> server_;

public:
    /**
     * @brief GameListener 생성자. acceptor를 열고 bind, listen까지 수행한다.
     * @param ioc 비동기 작업에 사용할 io_context 참조.
     * @param endpoint 리슨할 TCP 엔드포인트. 포트 0이면 시스템이 할당한다.
     * @param server GameServer 참조.
     * @throw std::system_error open/bind/listen 실패 시.
     */
    GameListener(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        std::shared_ptr<GameServer> server);

    /// @brief 비동기 accept 루프를 시작한다.
    void run();

    /// @brief acceptor를 닫아 더 이상 연결을 받지 않는다.
    void stop();

    /// @brief 실제로 바인드된 포트.
    unsigned short local_port() const;

private:
    void do_accept();

    /**
     * @brief accept 완료 콜백.
     * 성공 시 GameSession을 생성하고 시작한다.
     */
    void on_accept(beast::error_code ec, tcp::socket socket);
};
