#pragma once

#include <chrono>
#include <string>

/**
 * @file ServerConfig.hpp
 * @brief 환경 변수 기반 서버 설정을 정의한 헤더 파일.
 */

/**
 * @struct ServerConfig
 * @brief TicTacToe 서버 실행에 필요한 설정 값 모음.
 * @details 설정 로드는 spdlog 설정 이전에 일어나므로 읽은 값은 표준 출력으로 보고한다.
 */
struct ServerConfig {
    std::string bind_ip = "0.0.0.0";        ///< 리슨할 IP 주소
    unsigned short port = 9999;             ///< 리슨할 포트 (0이면 시스템이 할당)
    int threads = 4;                        ///< io_context 실행 스레드 수
    std::string log_level = "info";         ///< spdlog 로그 레벨 이름
    std::chrono::milliseconds handshake_timeout{10000};  ///< 핸드셰이크 대기 한도
    std::chrono::milliseconds game_over_linger{1000};    ///< 결과 전송 후 연결 종료까지 대기 시간
    std::chrono::milliseconds room_idle_timeout{300000}; ///< 플레이어 없는 방의 회수 기준 시간
    std::chrono::milliseconds room_reap_interval{30000}; ///< 방 회수 검사 주기
};

/**
 * @brief 환경 변수에서 포트 번호를 읽어온다. 없으면 기본값을 사용한다.
 * @param var_name 읽어올 환경 변수 이름.
 * @param default_port 환경 변수가 없을 경우 사용할 기본 포트 번호.
 * @return 읽어온 포트 번호 (unsigned short).
 * @throw std::runtime_error 값이 유효한 포트 범위(1-65535)가 아니거나 숫자로 변환 불가능한 경우.
 */
unsigned short get_required_port_env_var(const std::string& var_name, unsigned short default_port);

/**
 * @brief 환경 변수에서 문자열 값을 읽어온다. 없으면 기본값을 사용한다.
 */
std::string get_env_var(const std::string& var_name, const std::string& default_value);

/**
 * @brief 환경 변수에서 정수 값을 읽어온다. 없거나 유효하지 않으면 기본값을 사용한다.
 */
int get_int_env_var(const std::string& var_name, int default_value);

/**
 * @brief 모든 GAME_* 환경 변수를 읽어 설정을 만든다.
 * @throw std::runtime_error 포트 값이 잘못되었거나 시간/스레드 값이 양수가 아닌 경우.
 */
ServerConfig load_server_config_from_env();
