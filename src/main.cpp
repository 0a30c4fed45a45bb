#include "GameServer.hpp"
#include "ServerConfig.hpp"
#include "spdlog/spdlog.h"

#include <boost/asio/io_context.hpp> // Asio io_context
#include <boost/asio/signal_set.hpp>
#include <cstdio>
#include <csignal>                   // SIGINT, SIGTERM
#include <memory>
#include <stdexcept>                 // runtime_error
#include <string>
#include <system_error>              // std::system_error (예외 처리)
#include <thread>                    // std::thread
#include <vector>

namespace net = boost::asio;

/**
 * @file main.cpp
 * @brief TicTacToe 게임 서버 애플리케이션의 메인 진입점 파일.
 *
 * 환경 변수에서 설정을 읽어 게임 서버를 생성하고 공유 io_context 스레드 풀에서 실행한다.
 * POSIX 시그널(SIGINT, SIGTERM)을 처리하여 서버의 정상 종료(graceful shutdown)를 지원한다.
 */

/**
 * @brief 애플리케이션 메인 함수.
 * @return 성공 시 0, 오류 시 1.
 */
int main() {
    try {
        // --- 설정 값 읽기 (환경 변수 사용) ---
        ServerConfig config = load_server_config_from_env();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");

        const int num_threads = config.threads;
        net::io_context ioc{num_threads};

        auto game_server = std::make_shared<GameServer>(ioc, config);

        // --- signal_set 핸들러 설정 (서버 객체 생성 후) ---
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&game_server](const boost::system::error_code& ec, int signal_number) {
                if (ec) {
                    fprintf(stderr, "Signal wait error: %s\n", ec.message().c_str());
                    return;
                }
                fprintf(stdout, "\nShutdown signal (%d) received. Initiating graceful shutdown...\n", signal_number);
                game_server->stop();
            });

        // --- 서버 시작 ---
        game_server->run();
        fprintf(stdout, "Game server starting on %s:%hu (%d threads)\n", config.bind_ip.c_str(), game_server->port(), num_threads);

        // --- 공유 io_context 실행 스레드 시작 ---
        // stop() 이후 모든 연결이 닫히면 io_context의 작업이 소진되어 run()이 반환된다.
        std::vector<std::thread> io_threads;
        io_threads.reserve(num_threads);
        for (int i = 0; i < num_threads; ++i) {
            io_threads.emplace_back([&ioc, i]() {
                try {
                    ioc.run();
                    spdlog::debug("[IO Thread {}] io_context::run() finished.", i);
                } catch (const std::exception& e) {
                    spdlog::error("[IO Thread {}] Exception: {}", i, e.what());
                }
            });
        }

        for (auto& t : io_threads) {
            if (t.joinable()) {
                t.join();
            }
        }
        fprintf(stdout, "Main thread exiting after IO threads finished.\n");
    }
    catch (const std::system_error& e) {
        fprintf(stderr, "[Error] System error during server setup or execution: %s (code: %d)\n", e.what(), e.code().value());
        return 1;
    }
    catch (const std::runtime_error& e) {
        fprintf(stderr, "[Error] Runtime error during server setup: %s\n", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        fprintf(stderr, "[Error] Unhandled standard exception in main: %s\n", e.what());
        return 1;
    }

    fprintf(stdout, "Server application finished gracefully.\n");
    return 0;
}
