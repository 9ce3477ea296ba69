#pragma once

#include <boost/asio/generic/stream_protocol.hpp>

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// Stream
//   연결 하나의 양방향 스트림 타입.
//   listener 는 accept 한 tcp::socket 을 이 타입으로 move 변환해 넘긴다.
//   테스트는 local::stream_protocol 소켓 쌍을 같은 방식으로 변환해 사용한다.
// ---------------------------------------------------------------------------
using Stream = boost::asio::generic::stream_protocol::socket;

// 원격 주소를 알 수 없을 때 사용하는 값
inline constexpr const char* kUnknownRemoteAddress = "unknown";

// ---------------------------------------------------------------------------
// ConnectionContext
//   클라이언트 연결 하나를 식별하는 불변 컨텍스트.
//   listener 가 accept 시점에 생성하고 handler/logger/router 에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct ConnectionContext {
    std::uint64_t connection_id{0};                        // 프로세스 범위 내 유일 ID
    std::string   remote_address{kUnknownRemoteAddress};   // 클라이언트 IPv4/IPv6 주소 문자열
    std::uint16_t remote_port{0};                          // 클라이언트 TCP 포트
    std::chrono::system_clock::time_point connected_at{};  // accept 시각
};

// ---------------------------------------------------------------------------
// ParseErrorCode
//   패킷 레코드 파싱 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kMalformedRecord   = 0,  // JSON 레코드 구조가 올바르지 않음
    kUnknownPacketType = 1,  // packet_type 값이 알려진 종류가 아님
    kMissingField      = 2,  // 필수 필드 누락 또는 타입 불일치
    kRecordTooLarge    = 3,  // 레코드 최대 크기 초과
};

// ---------------------------------------------------------------------------
// ParseError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode code{ParseErrorCode::kMalformedRecord};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명
    std::string    context{};  // 오류가 발생한 위치/입력 단편 (로깅용)
};

// ---------------------------------------------------------------------------
// ErrorCode / ChatError
//   연결 I/O, 생성 실패, 감시 실패 등 파싱 외 오류.
// ---------------------------------------------------------------------------
enum class ErrorCode : std::uint8_t {
    kIoError       = 0,  // 소켓 읽기/쓰기 실패
    kWriterClosed  = 1,  // 이미 닫힌 writer 로 send 시도
    kInvalidStream = 2,  // 열리지 않은 스트림으로 생성 시도
    kWatchFailed   = 3,  // inotify 감시 설정/읽기 실패
    kConfigInvalid = 4,  // 설정 값/파일 오류
};

struct ChatError {
    ErrorCode   code{ErrorCode::kIoError};
    std::string message{};
    std::string context{};
};
