/**
 * @file GameRoom.cpp
 * @brief `GameRoom` 클래스의 멤버 함수 구현부입니다.
 */

#include "GameRoom.hpp"
#include "Protocol.hpp"
#include "RoomDirectory.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace {

const std::string& result_line(GameRoom::Outcome outcome) {
    switch (outcome) {
    case GameRoom::Outcome::PlayerOneWins:
        return protocol::kPlayerOneWins;
    case GameRoom::Outcome::PlayerTwoWins:
        return protocol::kPlayerTwoWins;
    case GameRoom::Outcome::Draw:
        return protocol::kDraw;
    default:
        return protocol::kAbandoned;
    }
}

const char* outcome_name(GameRoom::Outcome outcome) {
    switch (outcome) {
    case GameRoom::Outcome::None:          return "None";
    case GameRoom::Outcome::PlayerOneWins: return "PlayerOneWins";
    case GameRoom::Outcome::PlayerTwoWins: return "PlayerTwoWins";
    case GameRoom::Outcome::Draw:          return "Draw";
    case GameRoom::Outcome::Abandoned:     return "Abandoned";
    }
    return "Unknown";
}

} // namespace

GameRoom::GameRoom(net::any_io_executor executor,
                   std::string code,
                   std::chrono::milliseconds game_over_linger,
                   std::weak_ptr<RoomDirectory> directory)
    : code_(std::move(code)),
      strand_(net::make_strand(executor)),
      linger_timer_(strand_),
      game_over_linger_(game_over_linger),
      directory_(std::move(directory)),
      created_at_(std::chrono::steady_clock::now())
{
    spdlog::info("[GameRoom {}] Created.", code_);
}

GameRoom::~GameRoom() {
    spdlog::debug("[GameRoom {}] Destroyed.", code_);
}

// --- 플레이어 슬롯 (디렉터리 뮤텍스 아래) ---

std::size_t GameRoom::player_count() const {
    return static_cast<std::size_t>(std::count_if(players_.begin(), players_.end(),
        [](const SessionPtr& p) { return p != nullptr; }));
}

std::size_t GameRoom::add_player(SessionPtr session) {
    for (std::size_t i = 0; i < players_.size(); ++i) {
        if (!players_[i]) {
            players_[i] = std::move(session);
            return i;
        }
    }
    // RoomDirectory가 인원 확인 후에만 호출하므로 도달하지 않는다.
    spdlog::error("[GameRoom {}] add_player called on a full room.", code_);
    return kMaxPlayers;
}

bool GameRoom::vacate_player(const SessionPtr& session) {
    for (auto& slot : players_) {
        if (slot && slot == session) {
            slot.reset();
            return true;
        }
    }
    return false;
}

// --- strand 진입점 ---

/**
 * @details 두 플레이어가 모두 있는 상태에서 첫 수의 차례 안내를 보냅니다.
 *          시작 전에 떠난 플레이어가 있으면 즉시 결과를 발표하고,
 *          대기 중에 쌓인 메시지는 첫 안내 이후에 순서대로 처리합니다.
 */
void GameRoom::start() {
    net::post(strand_, [self = shared_from_this()]() {
        if (self->closed_ || self->phase_ != Phase::Pending) {
            spdlog::warn("[GameRoom {}] start() ignored in current state.", self->code_);
            return;
        }
        self->phase_ = Phase::InProgress;
        spdlog::info("[GameRoom {}] Game started: {} vs {}.", self->code_,
                     self->players_[0] ? self->players_[0]->remote_id() : "?",
                     self->players_[1] ? self->players_[1]->remote_id() : "?");

        if (self->departed_[0] || self->departed_[1]) {
            Outcome outcome = Outcome::Abandoned;
            if (!self->departed_[0]) {
                outcome = Outcome::PlayerOneWins;
            } else if (!self->departed_[1]) {
                outcome = Outcome::PlayerTwoWins;
            }
            self->finish(outcome);
            return;
        }

        self->begin_ply();

        auto pending = std::move(self->pending_messages_);
        self->pending_messages_.clear();
        for (auto& entry : pending) {
            if (self->phase_ != Phase::InProgress) {
                break;
            }
            self->handle_message(entry.first, entry.second);
        }
    });
}

void GameRoom::add_spectator(SessionPtr session) {
    net::post(strand_, [self = shared_from_this(), session = std::move(session)]() {
        if (self->closed_) {
            spdlog::info("[GameRoom {}] Spectator {} arrived after close.", self->code_, session->remote_id());
            session->close();
            return;
        }
        if (session->is_closed()) {
            spdlog::debug("[GameRoom {}] Spectator {} disconnected before registration.", self->code_, session->remote_id());
            return;
        }
        self->spectators_.push_back(session);
        spdlog::info("[GameRoom {}] Spectator {} joined ({} watching).",
                     self->code_, session->remote_id(), self->spectators_.size());

        // 역할 안내 직후 현재 보드를 동기화한다. 같은 strand 안이므로 스냅샷이 정확하다.
        bool synced = session->deliver(protocol::kSpectatorAssigned)
                   && session->deliver(protocol::kMatrix)
                   && session->deliver(self->board_.to_string());
        if (!synced) {
            spdlog::warn("[GameRoom {}] Failed to sync spectator {}, dropping.", self->code_, session->remote_id());
            self->spectators_.erase(std::remove(self->spectators_.begin(), self->spectators_.end(), session),
                                    self->spectators_.end());
            session->stop_session();
        }
    });
}

void GameRoom::on_message(SessionPtr origin, std::string text) {
    net::post(strand_, [self = shared_from_this(), origin = std::move(origin), text = std::move(text)]() {
        self->handle_message(origin, text);
    });
}

void GameRoom::on_disconnect(SessionPtr session) {
    net::post(strand_, [self = shared_from_this(), session = std::move(session)]() {
        self->handle_disconnect(session);
    });
}

void GameRoom::abandon() {
    net::post(strand_, [self = shared_from_this()]() {
        if (self->closed_) {
            return;
        }
        spdlog::info("[GameRoom {}] Abandoned (phase={}).", self->code_, static_cast<int>(self->phase_));
        if (self->phase_ != Phase::Finished) {
            self->phase_ = Phase::Finished;
            self->outcome_ = Outcome::Abandoned;
        }
        self->linger_timer_.cancel();
        self->close_all();
    });
}

// --- 릴레이 ---

std::string GameRoom::label_of(const SessionPtr& session) const {
    int idx = player_index_of(session);
    if (idx >= 0) {
        return "Player" + std::to_string(idx + 1);
    }
    auto it = std::find(spectators_.begin(), spectators_.end(), session);
    if (it != spectators_.end()) {
        return "spec_" + std::to_string(std::distance(spectators_.begin(), it) + 1);
    }
    return "Unknown";
}

void GameRoom::send_to_all(const std::string& msg) {
    send_to_players(msg);
    for (const auto& spectator : spectators_) {
        if (!spectator->deliver(msg)) {
            spdlog::trace("[GameRoom {}] Skipped closed spectator {}.", code_, spectator->remote_id());
        }
    }
}

void GameRoom::send_to_players(const std::string& msg) {
    for (std::size_t i = 0; i < players_.size(); ++i) {
        const auto& player = players_[i];
        if (!player || departed_[i]) {
            continue;
        }
        if (!player->deliver(msg)) {
            spdlog::trace("[GameRoom {}] Skipped closed player {}.", code_, player->remote_id());
        }
    }
}

void GameRoom::broadcast_chat(const SessionPtr& origin, const std::string& text) {
    std::string label = label_of(origin);
    spdlog::debug("[GameRoom {}] Chat from {}: {}", code_, label, text);
    send_to_all(protocol::format_chat(label, text));
}

// --- 턴 엔진 ---

/**
 * @details 현재 차례를 모든 연결에 알리고 차례인 플레이어에게만 `Input`을 보냅니다.
 *          입력 요청을 보낼 수 없으면 게임을 `Abandoned`로 끝냅니다.
 */
void GameRoom::begin_ply() {
    std::size_t idx = mover_index();
    send_to_all(protocol::turn_announcement(idx));

    const auto& mover = players_[idx];
    if (departed_[idx] || !mover || !mover->deliver(protocol::kInput)) {
        spdlog::error("[GameRoom {}] Cannot prompt player {} for ply {}.", code_, idx + 1, ply_);
        finish(Outcome::Abandoned);
        return;
    }
    spdlog::debug("[GameRoom {}] Ply {}: waiting for player {}.", code_, ply_, idx + 1);
}

void GameRoom::handle_message(const SessionPtr& origin, const std::string& text) {
    if (closed_ || phase_ == Phase::Finished) {
        return;
    }
    if (phase_ == Phase::Pending) {
        if (pending_messages_.size() >= kMaxPendingMessages) {
            spdlog::warn("[GameRoom {}] Pre-start buffer full, dropping oldest message.", code_);
            pending_messages_.pop_front();
        }
        pending_messages_.emplace_back(origin, text);
        return;
    }

    // 차례인 플레이어의 좌표 형식 메시지는 착수로 처리한다.
    if (origin && origin == players_[mover_index()] && try_move(text)) {
        return;
    }
    if (auto chat = protocol::parse_chat(text)) {
        broadcast_chat(origin, *chat);
        return;
    }
    spdlog::debug("[GameRoom {}] Ignored message from {}: '{}'", code_, label_of(origin), text);
}

/**
 * @details 좌표 형식이 아니면 false를 돌려 채팅 처리로 넘깁니다.
 *          형식은 맞지만 범위 밖이거나 이미 찬 칸이면 무시하고 같은 플레이어의 다음 입력을 기다립니다.
 * @return 메시지가 착수 시도로 소비되었으면 true.
 */
bool GameRoom::try_move(const std::string& text) {
    auto move = protocol::parse_move(text);
    if (!move) {
        return false;
    }

    std::size_t idx = mover_index();
    Mark mark = idx == 0 ? Mark::PlayerOne : Mark::PlayerTwo;
    if (!board_.place(move->row, move->col, mark)) {
        spdlog::info("[GameRoom {}] Rejected move ({}, {}) from player {}.", code_, move->row, move->col, idx + 1);
        return true;
    }

    ++ply_;
    send_to_all(protocol::kMatrix);
    send_to_all(board_.to_string());

    Mark winner = check_winner(board_);
    if (winner == Mark::PlayerOne) {
        finish(Outcome::PlayerOneWins);
    } else if (winner == Mark::PlayerTwo) {
        finish(Outcome::PlayerTwoWins);
    } else if (board_.is_full()) {
        finish(Outcome::Draw);
    } else {
        begin_ply();
    }
    return true;
}

void GameRoom::handle_disconnect(const SessionPtr& session) {
    if (closed_) {
        return;
    }
    if (phase_ == Phase::Pending) {
        // 떠난 연결의 대기 메시지는 이후 게임에 전달하지 않는다.
        drop_pending_from(session);
    }

    auto it = std::find(spectators_.begin(), spectators_.end(), session);
    if (it != spectators_.end()) {
        spectators_.erase(it);
        spdlog::info("[GameRoom {}] Spectator {} left ({} watching).", code_, session->remote_id(), spectators_.size());
        return;
    }

    if (phase_ == Phase::Pending) {
        auto directory = directory_.lock();
        auto result = directory ? directory->vacate_player(*this, session) : RoomDirectory::VacateResult::NotAPlayer;
        if (result == RoomDirectory::VacateResult::Vacated) {
            spdlog::info("[GameRoom {}] Waiting player {} left before start.", code_, session->remote_id());
        } else if (result == RoomDirectory::VacateResult::AlreadyStarted) {
            // 엔진 시작이 이미 확정되었으므로 start()에서 기권으로 처리된다.
            int idx = player_index_of(session);
            if (idx >= 0) {
                departed_[static_cast<std::size_t>(idx)] = true;
            }
        }
        return;
    }

    if (phase_ == Phase::InProgress) {
        int idx = player_index_of(session);
        if (idx < 0) {
            return;
        }
        spdlog::warn("[GameRoom {}] Player {} disconnected during the game; forfeit.", code_, idx + 1);
        departed_[static_cast<std::size_t>(idx)] = true;
        finish(idx == 0 ? Outcome::PlayerTwoWins : Outcome::PlayerOneWins);
    }
}

void GameRoom::drop_pending_from(const SessionPtr& session) {
    auto before = pending_messages_.size();
    pending_messages_.erase(
        std::remove_if(pending_messages_.begin(), pending_messages_.end(),
                       [&session](const std::pair<SessionPtr, std::string>& entry) { return entry.first == session; }),
        pending_messages_.end());
    if (pending_messages_.size() != before) {
        spdlog::debug("[GameRoom {}] Dropped {} queued message(s) from {}.",
                      code_, before - pending_messages_.size(), session->remote_id());
    }
}

/**
 * @details `Over`와 결과 문구를 모든 연결에 보내고, 잠시 기다린 뒤 모든 연결을 닫고
 *          디렉터리에서 방을 제거합니다.
 */
void GameRoom::finish(Outcome outcome) {
    if (phase_ == Phase::Finished) {
        return;
    }
    phase_ = Phase::Finished;
    outcome_ = outcome;
    spdlog::info("[GameRoom {}] Game over after {} plies: {}.", code_, ply_, outcome_name(outcome));

    send_to_all(protocol::kOver);
    send_to_all(result_line(outcome));

    linger_timer_.expires_after(game_over_linger_);
    linger_timer_.async_wait(net::bind_executor(strand_,
        [self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec && ec != net::error::operation_aborted) {
                spdlog::warn("[GameRoom {}] Linger timer error: {}", self->code_, ec.message());
            }
            self->close_all();
        }));
}

void GameRoom::close_all() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (auto directory = directory_.lock()) {
        directory->remove(code_, this);
    }
    for (const auto& player : players_) {
        if (player) {
            player->close();
        }
    }
    for (const auto& spectator : spectators_) {
        spectator->close();
    }
    spectators_.clear();
    pending_messages_.clear();
    spdlog::info("[GameRoom {}] Closed.", code_);
}

int GameRoom::player_index_of(const SessionPtr& session) const {
    if (!session) {
        return -1;
    }
    for (std::size_t i = 0; i < players_.size(); ++i) {
        if (players_[i] == session) {
            return static_cast<int>(i);
        }
    }
    return -1;
}
