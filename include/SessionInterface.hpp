#ifndef SESSION_INTERFACE_HPP
#define SESSION_INTERFACE_HPP

#include <memory>
#include <string>

/// 방(GameRoom)이 연결을 다룰 때 사용하는 세션 공통 인터페이스
class SessionInterface
{
public:
    virtual ~SessionInterface() = default;

    /// 클라이언트에게 토큰 하나를 전송 큐에 넣는다. 세션이 이미 닫혔으면 false.
    virtual bool deliver(const std::string& msg) = 0;

    /// 전송 큐를 모두 비운 뒤 연결을 닫는다.
    virtual void close() = 0;

    /// 즉시 연결을 끊는다. 대기 중인 메시지는 버려진다.
    virtual void stop_session() = 0;

    /// 세션이 닫혔는지 여부
    virtual bool is_closed() const = 0;

    /// 원격 ID (IP:port) getter
    virtual const std::string& remote_id() const = 0;
};

/// @brief SessionInterface에 대한 공유 포인터 타입 정의.
using SessionPtr = std::shared_ptr<SessionInterface>;

#endif // SESSION_INTERFACE_HPP
