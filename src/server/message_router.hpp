#pragma once

// ---------------------------------------------------------------------------
// message_router.hpp
//
// ACTIVE 상태에서 검증된 패킷을 넘겨받는 외부 협력자 인터페이스.
// 연결 간 전달(broadcast) 은 이 인터페이스 구현체의 책임이다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "protocol/packet.hpp"

// ---------------------------------------------------------------------------
// MessageRouter
//   route() 는 해당 연결의 strand 에서 호출된다. 구현체가 여러 연결의
//   상태를 공유한다면 직접 동기화해야 한다.
//   route() 에서 던진 예외는 해당 연결을 종료시킨다.
// ---------------------------------------------------------------------------
class MessageRouter {
public:
    virtual ~MessageRouter() = default;

    virtual void route(const ConnectionContext& ctx, const Packet& packet) = 0;
};

// ---------------------------------------------------------------------------
// LoggingMessageRouter
//   기본 구현: 수신 사실만 debug 로그로 남긴다.
// ---------------------------------------------------------------------------
class LoggingMessageRouter final : public MessageRouter {
public:
    void route(const ConnectionContext& ctx, const Packet& packet) override;
};
