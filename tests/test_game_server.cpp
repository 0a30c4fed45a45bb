#include "../include/GameServer.hpp"
#include "../include/Protocol.hpp"
#include "../include/RoomDirectory.hpp"
#include "../include/ServerConfig.hpp"
#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <boost/asio/read_until.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace net = boost::asio;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;

/**
 * @brief GameServer 종단 간 테스트를 위한 Fixture 클래스.
 * @details 각 테스트마다 127.0.0.1의 임의 포트(0)에 서버를 띄우고,
 *          서버용/클라이언트용 io_context를 별도 스레드에서 실행한다.
 */
class GameServerTest : public ::testing::Test {
protected:
    net::io_context server_ioc_;           ///< 서버용 io_context
    net::io_context client_ioc_;           ///< 클라이언트용 io_context
    std::vector<std::thread> server_threads_;
    std::thread client_thread_;
    std::shared_ptr<GameServer> server_;
    unsigned short test_port_ = 0;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> server_work_guard_;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> client_work_guard_;

    void SetUp() override {
        ServerConfig config;
        config.bind_ip = "127.0.0.1";
        config.port = 0;
        config.handshake_timeout = 300ms;
        config.game_over_linger = 50ms;

        server_work_guard_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
            server_ioc_.get_executor());
        client_work_guard_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
            client_ioc_.get_executor());

        try {
            server_ = std::make_shared<GameServer>(server_ioc_, config);
            server_->run();
            test_port_ = server_->port();
        } catch (const std::exception& e) {
            FAIL() << "Server setup failed: " << e.what();
        }

        // 턴 엔진이 여러 스레드에서 실행되는 상황을 재현하기 위해 서버 스레드는 둘 이상 둔다.
        for (int i = 0; i < 2; ++i) {
            server_threads_.emplace_back([this]() { server_ioc_.run(); });
        }
        client_thread_ = std::thread([this]() { client_ioc_.run(); });
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
            std::this_thread::sleep_for(100ms);
            server_.reset();
        }
        client_work_guard_.reset();
        server_work_guard_.reset();
        client_ioc_.stop();
        server_ioc_.stop();
        if (client_thread_.joinable()) client_thread_.join();
        for (auto& t : server_threads_) {
            if (t.joinable()) t.join();
        }
    }
};

// --- TestClient 클래스 ---
/**
 * @class TestClient
 * @brief GameServer 테스트를 위한 간단한 비동기 클라이언트.
 * @details 서버가 보내는 개행 단위 토큰을 모두 기록하고, 특정 토큰 수신이나 연결 종료를 기다릴 수 있다.
 */
class TestClient : public std::enable_shared_from_this<TestClient> {
    net::io_context& ioc_;
    tcp::socket socket_;
    net::streambuf response_buf_;
    std::deque<std::string> received_messages_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> connected_{false};

    void AsyncRead() {
        auto self = shared_from_this();
        net::async_read_until(socket_, response_buf_, "\n",
            [this, self](boost::system::error_code ec, std::size_t /*bytes*/) {
                if (ec) {
                    if (ec != net::error::eof && ec != net::error::operation_aborted && ec != net::error::connection_reset) {
                        spdlog::error("[TestClient] Read Error: {}", ec.message());
                    }
                    CloseInternal();
                    return;
                }
                // async_read_until은 구분자까지 보장하므로 마지막 개행까지의 완성된 줄만 꺼낸다.
                auto data = response_buf_.data();
                std::string chunk(net::buffers_begin(data), net::buffers_end(data));
                auto last_nl = chunk.rfind('\n');
                response_buf_.consume(last_nl + 1);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    std::istringstream lines(chunk.substr(0, last_nl));
                    std::string line;
                    while (std::getline(lines, line)) {
                        if (!line.empty() && line.back() == '\r') line.pop_back();
                        if (!line.empty()) received_messages_.push_back(line);
                    }
                }
                cv_.notify_all();
                AsyncRead();
            });
    }

    void CloseInternal() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_.exchange(false)) {
            boost::system::error_code ignored_ec;
            socket_.shutdown(tcp::socket::shutdown_both, ignored_ec);
            socket_.close(ignored_ec);
        }
        cv_.notify_all();
    }

public:
    explicit TestClient(net::io_context& ioc) : ioc_(ioc), socket_(ioc) {}

    bool Connect(unsigned short port) {
        try {
            socket_.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
            socket_.set_option(tcp::no_delay(true));
            connected_ = true;
            net::post(ioc_, [self = shared_from_this()]() { self->AsyncRead(); });
            return true;
        } catch (const std::exception& e) {
            spdlog::error("[TestClient] Connect Error: {}", e.what());
            return false;
        }
    }

    void Send(const std::string& message) {
        auto payload = std::make_shared<std::string>(message + "\n");
        net::post(ioc_, [self = shared_from_this(), payload]() {
            if (!self->connected_) return;
            net::async_write(self->socket_, net::buffer(*payload),
                [self, payload](boost::system::error_code ec, std::size_t) {
                    if (ec && ec != net::error::operation_aborted) {
                        spdlog::error("[TestClient] Send Error: {}", ec.message());
                    }
                });
        });
    }

    void Close() {
        net::post(ioc_, [self = shared_from_this()]() { self->CloseInternal(); });
    }

    /// 정확히 일치하는 토큰이 `n`번 이상 올 때까지 대기.
    bool WaitForCount(const std::string& token, std::size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() {
            return static_cast<std::size_t>(std::count(received_messages_.begin(), received_messages_.end(), token)) >= n;
        });
    }

    bool WaitFor(const std::string& token, std::chrono::milliseconds timeout = 2000ms) {
        return WaitForCount(token, 1, timeout);
    }

    /// 서버가 연결을 닫을 때까지 대기.
    bool WaitForDisconnect(std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return !connected_.load(); });
    }

    std::vector<std::string> GetMessages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return {received_messages_.begin(), received_messages_.end()};
    }
};

namespace {

std::shared_ptr<TestClient> Join(net::io_context& ioc, unsigned short port, const std::string& handshake) {
    auto client = std::make_shared<TestClient>(ioc);
    if (client->Connect(port)) {
        client->Send(handshake);
    }
    return client;
}

} // namespace

TEST_F(GameServerTest, ListensOnAssignedPort)
{
    EXPECT_NE(test_port_, 0);
}

TEST_F(GameServerTest, SecondServerOnSamePortFailsToBind)
{
    net::io_context other_ioc;
    ServerConfig config;
    config.bind_ip = "127.0.0.1";
    config.port = test_port_;
    auto other = std::make_shared<GameServer>(other_ioc, config);
    EXPECT_THROW(other->run(), std::system_error);
    EXPECT_EQ(other->port(), 0);
}

TEST_F(GameServerTest, FullGamePlayerOneWinsOnDiagonal)
{
    auto c1 = Join(client_ioc_, test_port_, "ROOM abc");
    ASSERT_TRUE(c1->WaitFor(protocol::kPlayerOneAssigned));
    auto c2 = Join(client_ioc_, test_port_, "room ABC");
    ASSERT_TRUE(c2->WaitFor(protocol::kPlayerTwoAssigned));

    ASSERT_TRUE(c1->WaitForCount(protocol::kInput, 1));
    c1->Send("0,0");
    ASSERT_TRUE(c2->WaitForCount(protocol::kInput, 1));
    c2->Send("0,1");
    ASSERT_TRUE(c1->WaitForCount(protocol::kInput, 2));
    c1->Send("1,1");
    ASSERT_TRUE(c2->WaitForCount(protocol::kInput, 2));
    c2->Send("0,2");
    ASSERT_TRUE(c1->WaitForCount(protocol::kInput, 3));
    c1->Send("2,2");

    for (const auto& c : {c1, c2}) {
        ASSERT_TRUE(c->WaitFor(protocol::kPlayerOneWins));
        EXPECT_TRUE(c->WaitForDisconnect());
        auto msgs = c->GetMessages();
        auto over = std::find(msgs.begin(), msgs.end(), protocol::kOver);
        ASSERT_NE(over, msgs.end());
        EXPECT_EQ(*(over - 1), "[[1, 2, 2], [0, 1, 0], [0, 0, 1]]");
        EXPECT_EQ(*(over + 1), protocol::kPlayerOneWins);
    }
    EXPECT_EQ(c1->GetMessages().front(), protocol::kPlayerOneAssigned);
    EXPECT_EQ(c1->GetMessages()[1], protocol::kPlayerOneTurn);

    // 게임이 끝난 방 코드는 다시 쓸 수 있다.
    auto again = Join(client_ioc_, test_port_, "ROOM abc");
    EXPECT_TRUE(again->WaitFor(protocol::kPlayerOneAssigned));
}

TEST_F(GameServerTest, PlayerTwoCompletesMainDiagonalInRoomABC)
{
    auto c1 = Join(client_ioc_, test_port_, "ROOM ABC");
    ASSERT_TRUE(c1->WaitFor(protocol::kPlayerOneAssigned));
    auto c2 = Join(client_ioc_, test_port_, "ROOM ABC");
    ASSERT_TRUE(c2->WaitFor(protocol::kPlayerTwoAssigned));

    const std::vector<std::string> moves = {"0,1", "0,0", "0,2", "1,1", "1,0", "2,2"};
    for (std::size_t i = 0; i < moves.size(); ++i) {
        auto& mover = i % 2 == 0 ? c1 : c2;
        ASSERT_TRUE(mover->WaitForCount(protocol::kInput, i / 2 + 1)) << "ply " << i;
        mover->Send(moves[i]);
    }

    for (const auto& c : {c1, c2}) {
        ASSERT_TRUE(c->WaitFor(protocol::kPlayerTwoWins));
        EXPECT_TRUE(c->WaitForDisconnect());
        auto msgs = c->GetMessages();
        auto over = std::find(msgs.begin(), msgs.end(), protocol::kOver);
        ASSERT_NE(over, msgs.end());
        EXPECT_EQ(*(over + 1), protocol::kPlayerTwoWins);
    }
}

TEST_F(GameServerTest, ThirdPlayerGetsRoomFull)
{
    auto c1 = Join(client_ioc_, test_port_, "ROOM full");
    ASSERT_TRUE(c1->WaitFor(protocol::kPlayerOneAssigned));
    auto c2 = Join(client_ioc_, test_port_, "ROOM full");
    ASSERT_TRUE(c2->WaitFor(protocol::kPlayerTwoAssigned));

    auto c3 = Join(client_ioc_, test_port_, "ROOM full");
    EXPECT_TRUE(c3->WaitFor(protocol::kRoomFull));
    EXPECT_TRUE(c3->WaitForDisconnect());
}

TEST_F(GameServerTest, UnknownHandshakeGetsProtocolError)
{
    auto c = Join(client_ioc_, test_port_, "HELLO there");
    EXPECT_TRUE(c->WaitFor(protocol::kProtocolError));
    EXPECT_TRUE(c->WaitForDisconnect());
    EXPECT_EQ(server_->directory()->size(), 0u);
}

TEST_F(GameServerTest, SilentClientIsDroppedAfterHandshakeTimeout)
{
    auto c = std::make_shared<TestClient>(client_ioc_);
    ASSERT_TRUE(c->Connect(test_port_));
    EXPECT_TRUE(c->WaitForDisconnect(2000ms));
    EXPECT_TRUE(c->GetMessages().empty());
}

TEST_F(GameServerTest, SpectatorSyncAndChatRelay)
{
    auto c1 = Join(client_ioc_, test_port_, "ROOM chat");
    ASSERT_TRUE(c1->WaitFor(protocol::kPlayerOneAssigned));
    auto c2 = Join(client_ioc_, test_port_, "ROOM chat");
    ASSERT_TRUE(c1->WaitForCount(protocol::kInput, 1));
    c1->Send("1,1");
    ASSERT_TRUE(c2->WaitForCount(protocol::kInput, 1));

    auto spectator = Join(client_ioc_, test_port_, "SPECTATE chat");
    ASSERT_TRUE(spectator->WaitFor("[[0, 0, 0], [0, 1, 0], [0, 0, 0]]"));
    auto synced = spectator->GetMessages();
    ASSERT_GE(synced.size(), 3u);
    EXPECT_EQ(synced[0], protocol::kSpectatorAssigned);
    EXPECT_EQ(synced[1], protocol::kMatrix);

    spectator->Send("CHAT:hi");
    c2->Send("CHAT:yo");
    for (const auto& c : {c1, c2, spectator}) {
        EXPECT_TRUE(c->WaitFor("CHAT:spec_1:hi"));
        EXPECT_TRUE(c->WaitFor("CHAT:Player2:yo"));
    }

    // 채팅 후에도 player 2의 차례는 유지된다.
    c2->Send("0,0");
    EXPECT_TRUE(spectator->WaitForCount(protocol::kMatrix, 2));
    EXPECT_TRUE(c1->WaitForCount(protocol::kInput, 2));
}

TEST_F(GameServerTest, PlayerDisconnectForfeitsGame)
{
    auto c1 = Join(client_ioc_, test_port_, "ROOM quit");
    ASSERT_TRUE(c1->WaitFor(protocol::kPlayerOneAssigned));
    auto c2 = Join(client_ioc_, test_port_, "ROOM quit");
    ASSERT_TRUE(c1->WaitForCount(protocol::kInput, 1));

    c1->Close();
    EXPECT_TRUE(c2->WaitFor(protocol::kPlayerTwoWins));
    EXPECT_TRUE(c2->WaitForDisconnect());
}

TEST_F(GameServerTest, HandshakeAndChatInOneWriteAreBothHandled)
{
    auto c1 = Join(client_ioc_, test_port_, "ROOM burst");
    ASSERT_TRUE(c1->WaitFor(protocol::kPlayerOneAssigned));
    auto c2 = Join(client_ioc_, test_port_, "ROOM burst\nCHAT:ready");
    EXPECT_TRUE(c1->WaitFor("CHAT:Player2:ready"));
}

TEST_F(GameServerTest, StopClosesOpenConnections)
{
    auto c1 = Join(client_ioc_, test_port_, "ROOM stop");
    ASSERT_TRUE(c1->WaitFor(protocol::kPlayerOneAssigned));
    auto spectator = Join(client_ioc_, test_port_, "SPECTATE other");
    ASSERT_TRUE(spectator->WaitFor(protocol::kSpectatorAssigned));

    server_->stop();
    EXPECT_TRUE(c1->WaitForDisconnect());
    EXPECT_TRUE(spectator->WaitForDisconnect());
}
