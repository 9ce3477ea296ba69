#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - ConnectionHandler / ConnectionState 를 include 하지 않는다.
//   이벤트 종류는 ConnectionEvent 로 별도 정의하고 호출자가 변환한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. CHATD_LOG_LEVEL 환경 변수에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ConnectionEvent
//   연결 수명 주기 중 구조화 로그로 남기는 지점.
// ---------------------------------------------------------------------------
enum class ConnectionEvent : std::uint8_t {
    kConnect        = 0,  // handshake 통과, ACTIVE 진입
    kBanned         = 1,  // ban list 매칭으로 종료
    kNotWhitelisted = 2,  // whitelist 미포함으로 종료
    kDisconnect     = 3,  // ACTIVE 이후 종료
    kRejected       = 4,  // handler 생성 실패 등으로 처리 전 종료
};

[[nodiscard]] constexpr auto connection_event_name(ConnectionEvent event) noexcept
    -> std::string_view {
    switch (event) {
        case ConnectionEvent::kConnect:        return "connect";
        case ConnectionEvent::kBanned:         return "banned";
        case ConnectionEvent::kNotWhitelisted: return "not_whitelisted";
        case ConnectionEvent::kDisconnect:     return "disconnect";
        case ConnectionEvent::kRejected:       return "rejected";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ConnectionLog
//   클라이언트 연결 이벤트 한 건.
//   reason          : 종료 사유 (connect 이벤트는 없음)
//   invalid_packets : 종료 시점까지 누적된 malformed 레코드 수
// ---------------------------------------------------------------------------
struct ConnectionLog {
    std::uint64_t                              connection_id{0};
    ConnectionEvent                            event{ConnectionEvent::kConnect};
    std::string                                remote_address{};
    std::uint16_t                              remote_port{0};
    std::optional<std::string>                 reason{};
    std::uint32_t                              invalid_packets{0};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// parse_log_level
//   "debug" | "info" | "warn" | "error" → LogLevel. 그 외는 kInfo.
// ---------------------------------------------------------------------------
[[nodiscard]] auto parse_log_level(std::string_view text) noexcept -> LogLevel;
