/**
 * @file Protocol.hpp
 * @brief 클라이언트와 서버가 주고받는 텍스트 토큰과 파싱/포맷 함수를 정의합니다.
 * @details 서버가 보내는 모든 토큰은 개별 메시지로 전송되며 `GameSession::deliver`가 끝에 개행을 붙입니다.
 *          클라이언트 메시지는 읽기 경계로 구분되고, 한 번의 읽기에 개행이 있으면 줄 단위로 나뉩니다.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

// --- 클라이언트 -> 서버 ---
inline const std::string kVerbRoom = "ROOM";
inline const std::string kVerbSpectate = "SPECTATE";
inline const std::string kChatPrefix = "CHAT:";

// --- 서버 -> 클라이언트 ---
inline const std::string kPlayerOneAssigned = "<<< You are player 1 >>>";
inline const std::string kPlayerTwoAssigned = "<<< You are player 2 >>>";
inline const std::string kSpectatorAssigned = "<<< You are spectator >>>";
inline const std::string kRoomFull = "Room Full";
inline const std::string kProtocolError = "Protocol Error";
inline const std::string kPlayerOneTurn = "Player One's Turn";
inline const std::string kPlayerTwoTurn = "Player Two's Turn";
inline const std::string kInput = "Input";
inline const std::string kMatrix = "Matrix";
inline const std::string kOver = "Over";
inline const std::string kPlayerOneWins = "Player One is the winner!!";
inline const std::string kPlayerTwoWins = "Player Two is the winner!!";
inline const std::string kDraw = "Draw game!! Try again later!";
inline const std::string kAbandoned = "Game abandoned!!";

/// 핸드셰이크로 요청한 역할.
enum class JoinMode {
    Player,
    Spectator
};

/// 파싱된 핸드셰이크 (`ROOM <code>` / `SPECTATE <code>`).
struct Handshake {
    JoinMode mode;
    std::string code; ///< 대문자로 정규화된 방 코드
};

/// 파싱된 착수 요청 (`<row>,<col>`). 범위 검증은 하지 않습니다.
struct MoveRequest {
    int row;
    int col;
};

/// 앞뒤 공백 문자를 제거합니다.
std::string trim(const std::string& s);

/// ASCII 대문자로 변환합니다.
std::string to_upper(std::string s);

/**
 * @brief 핸드셰이크 메시지를 파싱합니다.
 * @details 첫 번째 공백을 기준으로 동사와 코드를 나눕니다. 동사는 대소문자를 구분하지 않으며
 *          코드는 앞뒤 공백을 제거한 뒤 대문자로 정규화합니다.
 * @param line 클라이언트가 보낸 첫 메시지.
 * @return 동사가 ROOM/SPECTATE가 아니거나 코드가 비어 있으면 `std::nullopt`.
 */
std::optional<Handshake> parse_handshake(const std::string& line);

/**
 * @brief 착수 메시지를 파싱합니다.
 * @details 쉼표가 정확히 하나 있고 양쪽이 모두 정수(부호 허용, 앞뒤 공백 허용)일 때만 성공합니다.
 * @return 파싱 실패 시 `std::nullopt`. 좌표 범위는 호출자가 검증해야 합니다.
 */
std::optional<MoveRequest> parse_move(const std::string& text);

/**
 * @brief `CHAT:` 접두사가 붙은 메시지에서 본문을 꺼냅니다.
 * @return 접두사가 없으면 `std::nullopt`, 있으면 앞뒤 공백을 제거한 본문.
 */
std::optional<std::string> parse_chat(const std::string& text);

/// `CHAT:<label>:<text>` 형식의 릴레이 메시지를 만듭니다.
std::string format_chat(const std::string& label, const std::string& text);

/**
 * @brief 한 번의 읽기로 받은 데이터를 메시지 목록으로 나눕니다.
 * @details 개행이 없으면 전체가 하나의 메시지입니다. 각 메시지는 앞뒤 공백이 제거되고
 *          빈 메시지는 버려집니다.
 */
std::vector<std::string> split_messages(const std::string& chunk);

/// 플레이어 인덱스(0 또는 1)에 해당하는 차례 안내 문구.
const std::string& turn_announcement(std::size_t player_index);

/// 플레이어 인덱스(0 또는 1)에 해당하는 역할 배정 안내 문구.
const std::string& player_assignment(std::size_t player_index);

} // namespace protocol
