/**
 * @file GameRoom.hpp
 * @brief 한 게임 방의 참가자, 보드, 턴 진행 상태 머신을 관리하는 `GameRoom` 클래스를 정의합니다.
 */
#pragma once

#include "Board.hpp"
#include "SessionInterface.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

class RoomDirectory;

namespace net = boost::asio;

/**
 * @class GameRoom
 * @brief 하나의 게임 세션(방)을 나타내는 클래스.
 * @details 방 코드, 플레이어 두 명, 관전자 목록, 보드를 가지며 자신의 strand 위에서 턴 엔진을 실행합니다.
 *          `RoomDirectory`에 의해 생성되고 관리됩니다.
 *
 *          스레드 규칙:
 *          - 플레이어 슬롯(`players_`, `engine_claimed_`)은 엔진 시작 전까지 `RoomDirectory`의 뮤텍스 아래에서만 변경되며,
 *            엔진 시작이 결정된 뒤에는 변경되지 않습니다.
 *          - 그 외 모든 상태(보드, 관전자, 턴, 릴레이)는 방의 strand 안에서만 접근합니다.
 *            외부 스레드는 `start`, `add_spectator`, `on_message`, `on_disconnect`, `abandon`으로 작업을 게시합니다.
 */
class GameRoom : public std::enable_shared_from_this<GameRoom> {
public:
    /// 방의 진행 단계
    enum class Phase {
        Pending,    ///< 두 번째 플레이어 대기 중 (관전자만 있는 방 포함)
        InProgress, ///< 턴 엔진 실행 중
        Finished    ///< 결과 발표 완료, 종료 대기 또는 종료됨
    };

    /// 게임 결과
    enum class Outcome {
        None,
        PlayerOneWins,
        PlayerTwoWins,
        Draw,
        Abandoned ///< 차례 안내를 보낼 수 없었거나 방이 강제로 정리됨
    };

    static constexpr std::size_t kMaxPlayers = 2;
    static constexpr std::size_t kMaxPendingMessages = 64;

    /**
     * @brief GameRoom 생성자.
     * @param executor 방의 strand와 타이머가 사용할 executor.
     * @param code 대문자로 정규화된 방 코드.
     * @param game_over_linger 결과 발표 후 연결을 닫기까지 기다릴 시간.
     * @param directory 게임 종료 시 자신을 제거할 디렉터리.
     */
    GameRoom(net::any_io_executor executor,
             std::string code,
             std::chrono::milliseconds game_over_linger,
             std::weak_ptr<RoomDirectory> directory);
    ~GameRoom();

    const std::string& code() const { return code_; }
    std::chrono::steady_clock::time_point created_at() const { return created_at_; }

    // --- 플레이어 슬롯: RoomDirectory 뮤텍스 보호 하에서만 호출 ---

    /// 채워진 플레이어 슬롯 수
    std::size_t player_count() const;

    /// 턴 엔진 시작이 이미 결정되었는지 여부
    bool engine_claimed() const { return engine_claimed_; }

    /**
     * @brief 가장 앞의 빈 슬롯에 플레이어를 배정합니다.
     * @return 배정된 플레이어 인덱스 (0 = 플레이어 1, 1 = 플레이어 2).
     * @pre player_count() < kMaxPlayers 이고 엔진 시작 전.
     */
    std::size_t add_player(SessionPtr session);

    /// 두 번째 플레이어가 들어왔을 때 엔진 시작을 한 번만 확정합니다.
    void claim_engine() { engine_claimed_ = true; }

    /**
     * @brief 엔진 시작 전에 연결이 끊긴 플레이어의 슬롯을 비웁니다.
     * @return 해당 세션이 플레이어 슬롯에 있었으면 true.
     */
    bool vacate_player(const SessionPtr& session);

    // --- strand로 게시되는 진입점 (스레드 안전) ---

    /// 턴 엔진을 시작합니다. 두 번째 플레이어 합류 시 정확히 한 번 호출됩니다.
    void start();

    /// 관전자를 등록하고 역할 안내와 현재 보드를 보냅니다.
    void add_spectator(SessionPtr session);

    /// 방의 연결에서 받은 메시지 하나를 처리합니다.
    void on_message(SessionPtr origin, std::string text);

    /// 방의 연결이 끊겼음을 알립니다.
    void on_disconnect(SessionPtr session);

    /// 결과 발표 없이 모든 연결을 닫습니다 (유휴 방 회수, 서버 종료).
    void abandon();

    // --- strand 안에서만 호출 (단위 테스트는 io_context를 멈춘 상태에서 호출) ---

    Phase phase() const { return phase_; }
    Outcome outcome() const { return outcome_; }
    int ply() const { return ply_; }
    const Board& board() const { return board_; }
    std::size_t spectator_count() const { return spectators_.size(); }
    bool is_closed() const { return closed_; }

    /**
     * @brief 채팅 라벨을 계산합니다.
     * @return 플레이어면 `Player1`/`Player2`, 관전자면 `spec_<1부터 시작하는 위치>`, 그 외에는 `Unknown`.
     */
    std::string label_of(const SessionPtr& session) const;

    /// 모든 플레이어와 관전자에게 보냅니다. 한 연결의 실패가 다른 연결 전송을 막지 않습니다.
    void send_to_all(const std::string& msg);

    /// 두 플레이어에게만 보냅니다.
    void send_to_players(const std::string& msg);

    /// `CHAT:<label>:<text>` 형식으로 보낸 사람을 포함한 방 전체에 전달합니다.
    void broadcast_chat(const SessionPtr& origin, const std::string& text);

private:
    void begin_ply();
    void handle_message(const SessionPtr& origin, const std::string& text);
    bool try_move(const std::string& text);
    void handle_disconnect(const SessionPtr& session);
    void drop_pending_from(const SessionPtr& session);
    void finish(Outcome outcome);
    void close_all();

    std::size_t mover_index() const { return static_cast<std::size_t>(ply_ % 2); }
    int player_index_of(const SessionPtr& session) const;

    std::string code_;
    net::strand<net::any_io_executor> strand_;
    net::steady_timer linger_timer_;
    std::chrono::milliseconds game_over_linger_;
    std::weak_ptr<RoomDirectory> directory_;
    std::chrono::steady_clock::time_point created_at_;

    // RoomDirectory 뮤텍스로 보호 (엔진 시작 후 읽기 전용)
    std::array<SessionPtr, kMaxPlayers> players_;
    bool engine_claimed_ = false;

    // strand 전용 상태
    std::vector<SessionPtr> spectators_;
    std::array<bool, kMaxPlayers> departed_{};
    std::deque<std::pair<SessionPtr, std::string>> pending_messages_;
    Board board_;
    Phase phase_ = Phase::Pending;
    Outcome outcome_ = Outcome::None;
    int ply_ = 0;
    bool closed_ = false;
};
