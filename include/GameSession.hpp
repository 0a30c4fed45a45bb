/**
 * @file GameSession.hpp
 * @brief TCP 클라이언트 한 명과의 연결을 관리하는 `GameSession` 클래스를 정의합니다.
 * @details 첫 메시지(핸드셰이크)는 `GameServer`로 넘겨 방을 배정받고,
 *          그 이후의 메시지는 배정된 `GameRoom`으로 전달합니다.
 *          비동기 I/O는 Boost.Asio를 사용하며 모든 소켓 작업은 세션의 strand 위에서 수행됩니다.
 */
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/error.hpp> // For beast::error_code
#include "SessionInterface.hpp"

// Forward declarations
class GameServer;
class GameRoom;
namespace net = boost::asio;
using tcp = net::ip::tcp;
namespace beast = boost::beast;

/**
 * @class GameSession
 * @brief 개별 TCP 클라이언트와의 통신을 담당하는 클래스.
 * @details SessionInterface를 구현하며, 연결부터 종료까지 전체 생명주기를 관리합니다.
 * @see SessionInterface
 * @see GameServer
 */
class GameSession : public SessionInterface, public std::enable_shared_from_this<GameSession> {
public:
    /// 한 번의 읽기로 받는 최대 바이트 수
    static constexpr std::size_t kReadBufferSize = 20 * 1024;

private:
    tcp::socket socket_;
    std::shared_ptr<GameServer> server_;
    net::strand<net::any_io_executor> strand_;
    std::array<char, kReadBufferSize> read_buffer_;
    std::deque<std::string> write_msgs_;
    bool writing_flag_ = false;
    std::string remote_id_;
    std::shared_ptr<GameRoom> room_;
    bool handshake_done_ = false;
    net::steady_timer handshake_timer_;
    std::atomic<bool> closing_{false};
    std::atomic<bool> stopped_{false};

public:
    /**
     * @brief GameSession 생성자.
     * @param socket 클라이언트와 연결된 TCP 소켓. `std::move`를 통해 소유권이 이전됩니다.
     * @param server 세션이 속한 `GameServer`의 `shared_ptr`.
     */
    explicit GameSession(tcp::socket socket, std::shared_ptr<GameServer> server);
    ~GameSession();

    /**
     * @brief 세션 처리를 시작합니다.
     * @details 핸드셰이크 타이머를 걸고 첫 비동기 읽기를 시작합니다.
     */
    void start();

    // SessionInterface implementation
    /**
     * @brief 메시지를 전송 큐에 추가합니다. 끝에 개행이 붙어 하나의 쓰기로 전송됩니다.
     * @return 세션이 이미 닫혔거나 닫히는 중이면 false.
     * @override
     */
    bool deliver(const std::string& msg) override;
    /**
     * @brief 큐에 남은 메시지를 모두 보낸 뒤 연결을 닫습니다.
     * @override
     */
    void close() override;
    /**
     * @brief 대기 중인 작업을 취소하고 즉시 연결을 닫습니다.
     * @override
     */
    void stop_session() override;
    bool is_closed() const override { return stopped_.load(); }
    const std::string& remote_id() const override;

    /**
     * @brief 핸드셰이크가 성공했을 때 배정된 방을 연결합니다.
     * @details `GameServer::handle_handshake`에서 세션의 strand 위에서 호출됩니다.
     */
    void attach_room(std::shared_ptr<GameRoom> room);

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t length);
    void on_handshake_timeout(beast::error_code ec);
    /**
     * @brief 전송 큐의 첫 메시지를 비동기로 씁니다. 반드시 스트랜드 내에서 호출되어야 합니다.
     */
    void do_write_strand();
    void on_write(beast::error_code ec, std::size_t length);
    /// 소켓을 닫고 방에 연결 종료를 알립니다. 스트랜드 내에서만 호출합니다.
    void do_close();
};
