/**
 * @file RoomDirectory.cpp
 * @brief `RoomDirectory` 클래스의 멤버 함수 구현부입니다.
 */

#include "RoomDirectory.hpp"
#include "Protocol.hpp"
#include "spdlog/spdlog.h"

#include <utility>
#include <vector>

RoomDirectory::RoomDirectory(net::any_io_executor executor, std::chrono::milliseconds game_over_linger)
    : executor_(std::move(executor)), game_over_linger_(game_over_linger)
{
}

std::shared_ptr<GameRoom> RoomDirectory::find_or_create_locked(const std::string& code) {
    auto it = rooms_.find(code);
    if (it != rooms_.end()) {
        return it->second;
    }
    auto room = std::make_shared<GameRoom>(executor_, code, game_over_linger_, weak_from_this());
    rooms_.emplace(code, room);
    return room;
}

RoomDirectory::PlayerJoin RoomDirectory::join_locked(const std::string& key, const SessionPtr& session) {
    if (closed_) {
        return {PlayerJoinResult::Closed, nullptr};
    }
    auto room = find_or_create_locked(key);
    if (room->engine_claimed() || room->player_count() >= GameRoom::kMaxPlayers) {
        return {PlayerJoinResult::RoomFull, nullptr};
    }
    if (room->add_player(session) == 1) {
        room->claim_engine();
        return {PlayerJoinResult::PlayerTwo, room};
    }
    return {PlayerJoinResult::PlayerOne, room};
}

/**
 * @details 슬롯 배정과 엔진 시작 확정(`claim_engine`)은 뮤텍스 안에서 함께 이루어지므로
 *          같은 방에 동시에 들어온 두 연결이 모두 플레이어 2가 되거나 엔진이 두 번 시작되는 일은 없습니다.
 *          역할 안내는 세션의 전송 큐에 넣기만 하므로 뮤텍스 안에서 보냅니다. 그래야 플레이어 1의 안내가
 *          다른 스레드에서 시작된 엔진의 첫 차례 안내보다 항상 먼저 큐에 들어갑니다.
 */
RoomDirectory::PlayerJoin RoomDirectory::join_as_player(const std::string& code, const SessionPtr& session) {
    const std::string key = protocol::to_upper(code);
    PlayerJoin join{PlayerJoinResult::RoomFull, nullptr};
    bool delivered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        join = join_locked(key, session);
        if (join.result == PlayerJoinResult::Closed) {
            delivered = session->deliver(protocol::kProtocolError);
        } else if (join.result == PlayerJoinResult::RoomFull) {
            delivered = session->deliver(protocol::kRoomFull);
        } else {
            std::size_t idx = join.result == PlayerJoinResult::PlayerOne ? 0 : 1;
            delivered = session->deliver(protocol::player_assignment(idx));
        }
    }

    if (!delivered) {
        spdlog::warn("[RoomDirectory] Could not deliver join reply to {} (room {}).", session->remote_id(), key);
    }

    switch (join.result) {
    case PlayerJoinResult::Closed:
        spdlog::info("[RoomDirectory] {} rejected from room {}: directory closed.", session->remote_id(), key);
        session->close();
        break;
    case PlayerJoinResult::RoomFull:
        spdlog::info("[RoomDirectory] {} rejected from full room {}.", session->remote_id(), key);
        session->close();
        break;
    case PlayerJoinResult::PlayerOne:
        spdlog::info("[RoomDirectory] {} is player 1 in room {}.", session->remote_id(), key);
        break;
    case PlayerJoinResult::PlayerTwo:
        spdlog::info("[RoomDirectory] {} is player 2 in room {}; starting game.", session->remote_id(), key);
        join.room->start();
        break;
    }
    return join;
}

std::shared_ptr<GameRoom> RoomDirectory::join_as_spectator(const std::string& code, const SessionPtr& session) {
    const std::string key = protocol::to_upper(code);
    std::shared_ptr<GameRoom> room;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            if (!session->deliver(protocol::kProtocolError)) {
                spdlog::debug("[RoomDirectory] {} already closed.", session->remote_id());
            }
        } else {
            room = find_or_create_locked(key);
        }
    }
    if (!room) {
        spdlog::info("[RoomDirectory] Spectator {} rejected from room {}: directory closed.", session->remote_id(), key);
        session->close();
        return nullptr;
    }
    room->add_spectator(session);
    return room;
}

RoomDirectory::VacateResult RoomDirectory::vacate_player(GameRoom& room, const SessionPtr& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (room.engine_claimed()) {
        return VacateResult::AlreadyStarted;
    }
    return room.vacate_player(session) ? VacateResult::Vacated : VacateResult::NotAPlayer;
}

bool RoomDirectory::remove(const std::string& code, const GameRoom* room) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(code);
    if (it == rooms_.end() || it->second.get() != room) {
        return false;
    }
    rooms_.erase(it);
    spdlog::debug("[RoomDirectory] Room {} removed ({} remaining).", code, rooms_.size());
    return true;
}

std::shared_ptr<GameRoom> RoomDirectory::find(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(protocol::to_upper(code));
    return it == rooms_.end() ? nullptr : it->second;
}

std::size_t RoomDirectory::reap_idle(std::chrono::steady_clock::time_point now, std::chrono::milliseconds max_idle) {
    std::vector<std::shared_ptr<GameRoom>> reaped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = rooms_.begin(); it != rooms_.end();) {
            const auto& room = it->second;
            if (!room->engine_claimed() && room->player_count() == 0 && now - room->created_at() >= max_idle) {
                reaped.push_back(room);
                it = rooms_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& room : reaped) {
        spdlog::info("[RoomDirectory] Reaping idle room {}.", room->code());
        room->abandon();
    }
    return reaped.size();
}

void RoomDirectory::close_all() {
    std::map<std::string, std::shared_ptr<GameRoom>> rooms;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        rooms.swap(rooms_);
    }
    spdlog::info("[RoomDirectory] Closing {} room(s).", rooms.size());
    for (const auto& entry : rooms) {
        entry.second->abandon();
    }
}

std::size_t RoomDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}
