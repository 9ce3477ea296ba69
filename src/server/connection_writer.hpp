#pragma once

// ---------------------------------------------------------------------------
// connection_writer.hpp
//
// 연결 하나의 송신 방향을 소유한다.
//
// [단일 writer 규칙]
// - send() 는 어느 스레드에서든 호출할 수 있다. mutex_ 로 직렬화하므로
//   서로 다른 호출의 패킷 바이트가 섞이지 않고, 호출 순서대로 전송된다.
// - 한 레코드(JSON + '\n') 는 boost::asio::write 한 번으로 모두 전송된다.
//   반환 시점에 커널로 전달이 끝나 있으므로 별도 flush 단계가 없다.
//
// [수명]
// - 스트림은 ConnectionHandler 가 소유하고 writer 는 참조만 한다.
// - close() 는 송신 방향을 한 번만 shutdown 한다. 이후 send() 는 kWriterClosed.
//
// [종료 시 상한]
// - send() 는 상대가 읽지 않으면 소켓 버퍼가 빌 때까지 블록된다.
// - close_with() 는 마지막 패킷을 기다림 없이 한 번만 시도한다. 다른 send() 가
//   wait 이상 막혀 있으면 양방향 shutdown 으로 그 쓰기를 오류로 깨우고
//   마지막 패킷은 버린다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "protocol/packet.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>

class ConnectionWriter {
public:
    explicit ConnectionWriter(Stream& stream);

    ~ConnectionWriter() = default;

    ConnectionWriter(const ConnectionWriter&)            = delete;
    ConnectionWriter& operator=(const ConnectionWriter&) = delete;
    ConnectionWriter(ConnectionWriter&&)                 = delete;
    ConnectionWriter& operator=(ConnectionWriter&&)      = delete;

    // -----------------------------------------------------------------------
    // send
    //   packet 을 직렬화해 '\n' 과 함께 전송한다.
    //   실패 시:
    //     - close() 이후 호출       → kWriterClosed
    //     - 스트림 쓰기 오류        → kIoError
    // -----------------------------------------------------------------------
    [[nodiscard]] auto send(const Packet& packet) -> std::expected<void, ChatError>;

    // -----------------------------------------------------------------------
    // close
    //   송신 방향 shutdown. 두 번째 호출부터는 no-op (성공).
    //   shutdown 실패는 오류로 반환하지만 writer 는 닫힌 상태가 된다.
    // -----------------------------------------------------------------------
    auto close() -> std::expected<void, ChatError>;

    // -----------------------------------------------------------------------
    // close_with
    //   last 를 non-blocking 으로 한 번 전송한 뒤 close() 와 같이 닫는다.
    //   실패 시 (writer 는 항상 닫힌 상태가 된다):
    //     - 이미 닫힘                         → kWriterClosed
    //     - 다른 send() 가 wait 이상 점유     → kIoError (last 는 버림)
    //     - 송신 버퍼 가득 참 / 쓰기 오류     → kIoError
    // -----------------------------------------------------------------------
    auto close_with(const Packet& last, std::chrono::milliseconds wait)
        -> std::expected<void, ChatError>;

    [[nodiscard]] bool closed() const;
    [[nodiscard]] auto packets_sent() const -> std::uint64_t;

private:
    // 송신 방향 shutdown. mutex_ 를 잡은 상태에서 호출한다.
    auto shutdown_send_locked() -> std::optional<ChatError>;

    Stream&                  stream_;
    mutable std::timed_mutex mutex_;
    bool                     closed_{false};
    std::uint64_t            packets_sent_{0};
};
