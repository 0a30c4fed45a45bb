/**
 * @file GameSession.cpp
 * @brief `GameSession` 클래스의 구현부입니다.
 */

#include "GameSession.hpp"

#include "GameRoom.hpp"
#include "GameServer.hpp"
#include "Protocol.hpp"
#include "spdlog/spdlog.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

//------------------------------------------------------------------------------
// GameSession 클래스 멤버 함수 구현
//------------------------------------------------------------------------------

/**
 * @details 소켓과 서버 포인터를 멤버 변수에 저장하고, 스트랜드를 초기화합니다.
 *          클라이언트의 원격 엔드포인트 정보(IP:PORT)를 `remote_id_`로 설정합니다.
 */
GameSession::GameSession(tcp::socket socket, std::shared_ptr<GameServer> server)
    : socket_(std::move(socket)),
      server_(std::move(server)),
      strand_(net::make_strand(socket_.get_executor())),
      handshake_timer_(socket_.get_executor())
{
    beast::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        spdlog::error("[GameSession {} - ???] Failed to get remote endpoint: {}", static_cast<void*>(this), ec.message());
        remote_id_ = "UnknownClient";
    } else {
        remote_id_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
    spdlog::debug("[GameSession {} - {}] Created.", static_cast<void*>(this), remote_id_);
}

GameSession::~GameSession() {
    spdlog::debug("[GameSession {} - {}] Destroyed.", static_cast<void*>(this), remote_id_);
}

void GameSession::start()
{
    if (stopped_.load()) {
        spdlog::warn("[GameSession {}] start() called on stopped session.", static_cast<void*>(this));
        return;
    }
    spdlog::info("[GameSession {}] Starting session for {}.", static_cast<void*>(this), remote_id_);

    net::dispatch(strand_, [self = shared_from_this()]() {
        if (self->stopped_.load()) {
            return;
        }
        self->handshake_timer_.expires_after(self->server_->config().handshake_timeout);
        self->handshake_timer_.async_wait(net::bind_executor(self->strand_,
            [self](beast::error_code ec) { self->on_handshake_timeout(ec); }));
        self->do_read();
    });
}

void GameSession::stop_session() {
    net::dispatch(strand_, [self = shared_from_this()]() { self->do_close(); });
}

/**
 * @details 대기 중인 쓰기가 없으면 바로 닫고, 있으면 `on_write`가 큐를 비운 뒤 닫습니다.
 *          닫기 요청 이후의 `deliver`는 무시됩니다.
 */
void GameSession::close() {
    if (stopped_.load() || closing_.exchange(true)) {
        return;
    }
    net::post(strand_, [self = shared_from_this()]() {
        if (self->write_msgs_.empty() && !self->writing_flag_) {
            self->do_close();
        }
    });
}

/**
 * @details 메시지를 `write_msgs_` 큐에 추가합니다. `net::post`를 사용하여
 *          이 작업을 세션의 스트랜드에서 안전하게 실행하도록 합니다.
 *          쓰기 작업이 진행 중이지 않았다면 새로운 쓰기 작업을 시작합니다.
 */
bool GameSession::deliver(const std::string& msg) {
    if (stopped_.load() || closing_.load()) {
        spdlog::trace("[GameSession {}] deliver called but closed, ignoring msg: {}", static_cast<void*>(this), msg);
        return false;
    }
    net::post(strand_, [self = shared_from_this(), msg]() {
        if (self->stopped_) {
            return;
        }
        bool start_write = self->write_msgs_.empty() && !self->writing_flag_;
        self->write_msgs_.push_back(msg + "\n");
        spdlog::trace("[GameSession {}] Queued msg: '{}'. Queue size: {}", static_cast<void*>(self.get()), msg, self->write_msgs_.size());
        if (start_write) {
            self->do_write_strand();
        }
    });
    return true;
}

const std::string& GameSession::remote_id() const { return remote_id_; }

void GameSession::attach_room(std::shared_ptr<GameRoom> room) {
    room_ = std::move(room);
}

// --- Private Methods ---

void GameSession::do_read() {
    if (stopped_ || !socket_.is_open()) return;
    auto self = shared_from_this();
    socket_.async_read_some(net::buffer(read_buffer_),
        net::bind_executor(strand_,
            [this, self](beast::error_code ec, std::size_t length) {
                on_read(ec, length);
            }));
}

/**
 * @details 한 번의 읽기로 받은 데이터를 메시지 목록으로 나눕니다.
 *          - 핸드셰이크 전: 첫 메시지는 `GameServer::handle_handshake`로 넘기고,
 *            같은 읽기에 뒤따라온 메시지는 배정된 방으로 전달합니다.
 *          - 핸드셰이크 후: 모든 메시지를 방으로 전달합니다.
 *          EOF나 연결 리셋 등 읽기 오류가 나면 세션을 닫습니다.
 */
void GameSession::on_read(beast::error_code ec, std::size_t length) {
    if (stopped_) return;

    if (ec) {
        if (ec == net::error::eof) {
            spdlog::info("[GameSession {} - {}] Connection closed by peer (EOF).", static_cast<void*>(this), remote_id_);
        } else if (ec == net::error::connection_reset) {
            spdlog::info("[GameSession {} - {}] Connection reset by peer.", static_cast<void*>(this), remote_id_);
        } else if (ec == net::error::operation_aborted) {
            spdlog::debug("[GameSession {} - {}] Read operation aborted.", static_cast<void*>(this), remote_id_);
        } else {
            spdlog::error("[GameSession {} - {}] Read error: {} ({})", static_cast<void*>(this), remote_id_, ec.message(), ec.value());
        }
        do_close();
        return;
    }

    std::vector<std::string> messages = protocol::split_messages(std::string(read_buffer_.data(), length));
    auto self = shared_from_this();
    auto it = messages.begin();

    if (!handshake_done_) {
        handshake_done_ = true;
        handshake_timer_.cancel();
        std::string first = it != messages.end() ? *it++ : std::string();
        spdlog::info("[GameSession {} - {}] Handshake: '{}'", static_cast<void*>(this), remote_id_, first);
        server_->handle_handshake(self, first);
    }

    for (; it != messages.end(); ++it) {
        if (!room_) {
            break;
        }
        spdlog::debug("[GameSession {} - {}] Received: {}", static_cast<void*>(this), remote_id_, *it);
        room_->on_message(self, std::move(*it));
    }

    if (!stopped_) {
        do_read();
    }
}

void GameSession::on_handshake_timeout(beast::error_code ec) {
    if (ec == net::error::operation_aborted || handshake_done_ || stopped_) {
        return;
    }
    spdlog::warn("[GameSession {} - {}] No handshake received in time, closing.", static_cast<void*>(this), remote_id_);
    do_close();
}

void GameSession::do_write_strand() {
    if (stopped_ || write_msgs_.empty() || writing_flag_) {
        return;
    }
    writing_flag_ = true;

    auto self = shared_from_this();
    net::async_write(socket_,
        net::buffer(write_msgs_.front()),
        net::bind_executor(strand_,
            [this, self](beast::error_code ec, std::size_t length) {
                on_write(ec, length);
            }));
}

/**
 * @details 전송이 끝난 메시지를 큐에서 제거하고 다음 메시지를 씁니다.
 *          닫기 요청이 있었고 큐가 비었으면 연결을 닫습니다.
 */
void GameSession::on_write(beast::error_code ec, std::size_t /*length*/) {
    writing_flag_ = false;
    if (stopped_) {
        return;
    }

    if (ec) {
        if (ec != net::error::operation_aborted) {
            spdlog::error("[GameSession {} - {}] Write error: {} ({})", static_cast<void*>(this), remote_id_, ec.message(), ec.value());
        }
        write_msgs_.clear();
        do_close();
        return;
    }

    write_msgs_.pop_front();
    if (!write_msgs_.empty()) {
        do_write_strand();
    } else if (closing_) {
        do_close();
    }
}

/**
 * @details `stopped_` 플래그로 한 번만 실행됩니다. 소켓을 정상 종료(shutdown)한 후 닫고,
 *          방이 배정되어 있었다면 연결 종료를 알립니다. 방에 대한 참조도 여기서 놓습니다.
 */
void GameSession::do_close() {
    if (stopped_.exchange(true)) return;

    handshake_timer_.cancel();
    if (socket_.is_open()) {
        beast::error_code ignored_ec;
        socket_.shutdown(tcp::socket::shutdown_both, ignored_ec);
        socket_.close(ignored_ec);
        if (ignored_ec) {
            spdlog::error("[GameSession {} - {}] Socket close error: {}", static_cast<void*>(this), remote_id_, ignored_ec.message());
        } else {
            spdlog::info("[GameSession {} - {}] Socket closed.", static_cast<void*>(this), remote_id_);
        }
    }
    write_msgs_.clear();

    if (auto room = std::move(room_)) {
        room->on_disconnect(shared_from_this());
    }
}
