#pragma once

#include "common/types.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// ---------------------------------------------------------------------------
// PacketType
//   와이어 레코드의 "packet_type" 판별자.
//   와이어 표기는 대문자 snake case (예: NOT_WHITELISTED).
// ---------------------------------------------------------------------------
enum class PacketType : std::uint8_t {
    kBanned           = 0,
    kNotWhitelisted   = 1,
    kConnectionClosed = 2,
    kUsername         = 3,
    kClientMessage    = 4,
};

// ---------------------------------------------------------------------------
// 패킷 종류별 페이로드
//   각 구조체는 해당 종류의 필드만 가진다. 필드는 종류 간에 공유하지 않는다.
// ---------------------------------------------------------------------------
struct BannedPacket {
    bool operator==(const BannedPacket&) const = default;
};

struct NotWhitelistedPacket {
    bool operator==(const NotWhitelistedPacket&) const = default;
};

struct ConnectionClosedPacket {
    std::optional<std::string> reason{};  // 없으면 와이어에서 생략

    bool operator==(const ConnectionClosedPacket&) const = default;
};

struct UsernamePacket {
    std::string username{};

    bool operator==(const UsernamePacket&) const = default;
};

struct ClientMessagePacket {
    std::string message{};
    bool        encrypted{false};  // 플래그만 전달, 암호화는 수행하지 않는다
    std::string chat{};

    bool operator==(const ClientMessagePacket&) const = default;
};

// ---------------------------------------------------------------------------
// Packet
//   판별 가능한 불변 프로토콜 메시지 하나.
//
//   Wire 포맷 (레코드 1개, 개행으로 종료):
//     {"packet_type":"CLIENT_MESSAGE","message":"hi","encrypted":false,"chat":"main"}
//
//   serialize()    : 개행 없는 JSON 레코드 문자열
//   parse_record() : 레코드 1개(JSON object 텍스트)를 Packet 으로 변환
// ---------------------------------------------------------------------------
class Packet {
public:
    using Payload = std::variant<BannedPacket,
                                 NotWhitelistedPacket,
                                 ConnectionClosedPacket,
                                 UsernamePacket,
                                 ClientMessagePacket>;

    explicit Packet(Payload payload);

    static auto banned() -> Packet;
    static auto not_whitelisted() -> Packet;
    static auto connection_closed(std::optional<std::string> reason) -> Packet;
    static auto username(std::string name) -> Packet;
    static auto client_message(std::string message, bool encrypted, std::string chat) -> Packet;

    // -----------------------------------------------------------------------
    // parse_record
    //   flat JSON object 하나를 해석한다. 알 수 없는 필드는 무시한다.
    //
    //   실패 시: std::unexpected(ParseError)
    //     - JSON 구문 오류, 중첩 값           → kMalformedRecord
    //     - packet_type 누락/알 수 없는 값     → kUnknownPacketType
    //     - 필수 필드 누락/타입 불일치         → kMissingField
    // -----------------------------------------------------------------------
    static auto parse_record(std::string_view record)
        -> std::expected<Packet, ParseError>;

    [[nodiscard]] auto type()      const noexcept -> PacketType;
    [[nodiscard]] auto payload()   const noexcept -> const Payload&;
    [[nodiscard]] auto serialize() const -> std::string;

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&payload_);
    }

    bool operator==(const Packet&) const = default;

private:
    Payload payload_;
};

// ---------------------------------------------------------------------------
// 판별자 이름 변환
//   packet_type_name         : PacketType → "NOT_WHITELISTED"
//   packet_type_from_name    : "NOT_WHITELISTED" → PacketType (대소문자 구분)
//   packet_type_display_name : PacketType → "Not whitelisted" (진단 로그 전용)
// ---------------------------------------------------------------------------
[[nodiscard]] auto packet_type_name(PacketType type) noexcept -> std::string_view;
[[nodiscard]] auto packet_type_from_name(std::string_view name) noexcept
    -> std::optional<PacketType>;
[[nodiscard]] auto packet_type_display_name(PacketType type) -> std::string;
