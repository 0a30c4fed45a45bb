#pragma once

#include "../include/SessionInterface.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief 전송된 메시지를 기록하기만 하는 테스트용 세션.
 * @details 소켓 없이 GameRoom/RoomDirectory의 동작을 검증할 때 사용한다.
 */
class FakeSession : public SessionInterface {
public:
    explicit FakeSession(std::string id) : id_(std::move(id)) {}

    bool deliver(const std::string& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || fail_deliver_) return false;
        messages_.push_back(msg);
        return true;
    }
    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    void stop_session() override { close(); }
    bool is_closed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }
    const std::string& remote_id() const override { return id_; }

    void fail_deliveries() {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_deliver_ = true;
    }
    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }
    std::string last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.empty() ? "" : messages_.back();
    }
    std::size_t count(const std::string& msg) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count(messages_.begin(), messages_.end(), msg));
    }
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

private:
    std::string id_;
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    bool closed_ = false;
    bool fail_deliver_ = false;
};
