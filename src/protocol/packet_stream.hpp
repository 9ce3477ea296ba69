#pragma once

#include "protocol/packet.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// PacketStreamParser
//   연결 하나의 수신 바이트 스트림을 패킷 레코드 단위로 잘라 해석한다.
//
//   lenient 규칙:
//     - 레코드 사이의 공백, 개행, ',', '[', ']' 는 구분자로 보고 무시한다
//       (배열로 감싸지 않은 연속 레코드 스트림 허용).
//     - 레코드 내부에서 '{' 를 만나면 현재 레코드는 malformed, 그 '{' 에서
//       다음 레코드를 시작한다 (재동기화 지점).
//     - 레코드 내부에서 개행을 만나면 현재 레코드는 malformed, 개행 다음부터 재개.
//     - 레코드 밖의 그 외 바이트 묶음은 malformed 레코드 1개로 보고
//       다음 '{' 또는 개행까지 건너뛴다.
//     - kMaxRecordSize 를 넘는 레코드는 malformed, 다음 개행까지 버린다.
//
//   스레드 안전성: 없음. 연결의 읽기 컨텍스트(strand) 에서만 사용한다.
// ---------------------------------------------------------------------------
class PacketStreamParser {
public:
    using Item = std::expected<Packet, ParseError>;

    static constexpr std::size_t kMaxRecordSize = 64U * 1024U;

    PacketStreamParser() = default;

    // feed: 수신한 바이트를 내부 버퍼에 덧붙인다.
    void feed(std::string_view bytes);

    // -----------------------------------------------------------------------
    // next
    //   버퍼에서 다음 레코드 하나를 꺼낸다.
    //   - 완성된 레코드가 없으면 std::nullopt (더 읽어야 함)
    //   - 성공 레코드 → Packet, malformed 레코드 → ParseError
    // -----------------------------------------------------------------------
    [[nodiscard]] auto next() -> std::optional<Item>;

    // 아직 처리되지 않은 바이트 수
    [[nodiscard]] auto buffered() const noexcept -> std::size_t;

private:
    // compact: 소비한 앞부분을 버퍼에서 제거
    void compact();

    std::string buffer_{};
    std::size_t pos_{0};
    bool        discarding_{false};  // 초과 크기 레코드를 개행까지 버리는 중
};
