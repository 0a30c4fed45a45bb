/**
 * @file RoomDirectory.hpp
 * @brief 방 코드로 `GameRoom`을 찾고 만드는 프로세스 전역 디렉터리를 정의합니다.
 */
#pragma once

#include "GameRoom.hpp"
#include "SessionInterface.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/any_io_executor.hpp>

namespace net = boost::asio;

/**
 * @class RoomDirectory
 * @brief 방 코드에서 방으로의 매핑을 관리하는 클래스.
 * @details 모든 조회, 생성, 제거, 플레이어 슬롯 변경은 하나의 뮤텍스 아래에서 수행됩니다.
 *          역할 안내와 `Room Full` 응답은 뮤텍스 안에서 `deliver`로 보냅니다. `deliver`는 세션의 전송 큐에
 *          넣기만 하고 네트워크 I/O를 하지 않습니다. 연결 종료와 엔진 시작은 뮤텍스를 놓은 뒤에 수행합니다.
 *          `close_all` 이후의 입장은 모두 거절됩니다.
 *          방이 자신을 제거할 수 있도록 `std::shared_ptr`로만 생성해야 합니다.
 */
class RoomDirectory : public std::enable_shared_from_this<RoomDirectory> {
public:
    /// 플레이어 입장 결과
    enum class PlayerJoinResult {
        PlayerOne, ///< 새 방을 만들었거나 비어 있던 방에 첫 번째로 입장
        PlayerTwo, ///< 두 번째로 입장하여 게임 시작
        RoomFull,  ///< 이미 두 명이 있어 거절됨
        Closed     ///< 서버 종료 중이라 거절됨
    };

    /// `vacate_player` 결과
    enum class VacateResult {
        Vacated,        ///< 대기 중이던 플레이어 슬롯을 비움
        NotAPlayer,     ///< 해당 세션은 이 방의 플레이어가 아님
        AlreadyStarted  ///< 엔진 시작이 이미 확정되어 슬롯을 비울 수 없음
    };

    struct PlayerJoin {
        PlayerJoinResult result;
        std::shared_ptr<GameRoom> room; ///< RoomFull, Closed이면 nullptr
    };

    /**
     * @param executor 새로 만드는 방이 사용할 executor.
     * @param game_over_linger 방에 전달할 결과 발표 후 대기 시간.
     */
    RoomDirectory(net::any_io_executor executor, std::chrono::milliseconds game_over_linger);

    /**
     * @brief 플레이어로 입장시킵니다.
     * @details 방이 없으면 만들고, 한 자리가 비어 있으면 배정하며, 꽉 차 있으면 거절합니다.
     *          역할 안내(또는 `Room Full`)는 뮤텍스 안에서 전송 큐에 넣고, 뮤텍스를 놓은 뒤
     *          거절된 연결을 닫거나 두 번째 플레이어였다면 엔진을 정확히 한 번 시작합니다.
     *          디렉터리가 닫힌 뒤에는 `Protocol Error`를 보내고 연결을 닫습니다.
     */
    PlayerJoin join_as_player(const std::string& code, const SessionPtr& session);

    /**
     * @brief 관전자로 입장시킵니다. 방이 없으면 플레이어 없이 방을 만듭니다.
     * @return 관전자가 등록될 방. 디렉터리가 닫혔으면 `Protocol Error`를 보내고 연결을 닫은 뒤 nullptr.
     */
    std::shared_ptr<GameRoom> join_as_spectator(const std::string& code, const SessionPtr& session);

    /// 엔진 시작 전 떠난 플레이어의 슬롯을 뮤텍스 아래에서 비웁니다.
    VacateResult vacate_player(GameRoom& room, const SessionPtr& session);

    /**
     * @brief 코드에 해당하는 항목이 바로 그 방일 때만 제거합니다.
     * @return 제거했으면 true.
     */
    bool remove(const std::string& code, const GameRoom* room);

    /// 코드로 방을 찾습니다. 없으면 nullptr.
    std::shared_ptr<GameRoom> find(const std::string& code) const;

    /**
     * @brief 플레이어가 없고 엔진이 시작되지 않았으며 `max_idle`보다 오래된 방을 제거합니다.
     * @return 제거한 방의 수. 제거된 방의 관전자 연결은 닫힙니다.
     */
    std::size_t reap_idle(std::chrono::steady_clock::time_point now, std::chrono::milliseconds max_idle);

    /// 모든 방을 제거하고 연결을 닫습니다. 서버 종료 시 사용하며, 이후의 입장은 거절됩니다.
    void close_all();

    /// 현재 등록된 방의 수
    std::size_t size() const;

private:
    std::shared_ptr<GameRoom> find_or_create_locked(const std::string& code);
    PlayerJoin join_locked(const std::string& key, const SessionPtr& session);

    net::any_io_executor executor_;
    std::chrono::milliseconds game_over_linger_;
    std::map<std::string, std::shared_ptr<GameRoom>> rooms_;
    mutable std::mutex mutex_;
    bool closed_ = false; ///< mutex_ 보호
};
