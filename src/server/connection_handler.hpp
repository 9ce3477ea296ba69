#pragma once

#include "common/types.hpp"
#include "config/settings_store.hpp"
#include "logger/structured_logger.hpp"
#include "protocol/packet.hpp"
#include "protocol/packet_stream.hpp"
#include "server/connection_writer.hpp"
#include "server/message_router.hpp"
#include "stats/connection_stats.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

class ConnectionListener;

// ---------------------------------------------------------------------------
// ConnectionState
//   ConnectionHandler 의 생명주기 상태.
//
//   kHandshake : ban / whitelist 판정 중
//   kActive    : 패킷 수신 루프 진행 중
//   kClosing   : 종료 절차 진행 중 (ConnectionClosed 전송 → 자원 해제)
//   kClosed    : 종료 완료 (ACTIVE 이후 또는 handshake 중 외부 close)
//   kBanned    : ban list 매칭으로 종료 완료 (ACTIVE 를 거치지 않음)
//   kRejected  : whitelist 미포함으로 종료 완료 (ACTIVE 를 거치지 않음)
// ---------------------------------------------------------------------------
enum class ConnectionState : std::uint8_t {
    kHandshake = 0,
    kActive    = 1,
    kClosing   = 2,
    kClosed    = 3,
    kBanned    = 4,
    kRejected  = 5,
};

[[nodiscard]] auto connection_state_name(ConnectionState state) noexcept -> std::string_view;

// kClosed / kBanned / kRejected
[[nodiscard]] bool is_terminal(ConnectionState state) noexcept;

// ---------------------------------------------------------------------------
// ConnectionHandler
//   accept 된 연결 하나를 handshake 부터 종료까지 담당한다.
//
//   생명주기:
//     1. create() 로 생성 (열리지 않은 스트림이면 실패)
//     2. start() → strand 위에서 run() 코루틴 시작
//     3. handshake → ACTIVE 수신 루프 → close() → teardown
//
//   스레드 안전성:
//     run()/refresh_loop()/teardown 은 모두 strand_ 위에서 실행된다.
//     close() / send() / state() 는 어느 스레드에서든 호출할 수 있다.
// ---------------------------------------------------------------------------
class ConnectionHandler : public std::enable_shared_from_this<ConnectionHandler> {
public:
    struct Dependencies {
        ConnectionListener& listener;
        SettingsStore&      settings;
        MessageRouter&      router;
        StructuredLogger&   logger;
        ConnectionStats&    stats;
    };

    // -----------------------------------------------------------------------
    // create
    //   stream : accept 된 스트림 (move 소유권 이전)
    //   ctx    : 연결 컨텍스트 (connection_id, remote_address ...)
    //   실패 시: kInvalidStream (스트림이 열려 있지 않음)
    // -----------------------------------------------------------------------
    [[nodiscard]] static auto create(Stream stream, ConnectionContext ctx, Dependencies deps)
        -> std::expected<std::shared_ptr<ConnectionHandler>, ChatError>;

    ~ConnectionHandler() = default;

    ConnectionHandler(const ConnectionHandler&)            = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;
    ConnectionHandler(ConnectionHandler&&)                 = delete;
    ConnectionHandler& operator=(ConnectionHandler&&)      = delete;

    // start: strand 위에 run() 을 spawn 한다. 한 번만 호출한다.
    void start();

    // -----------------------------------------------------------------------
    // close
    //   연결을 종료한다. 어느 스레드에서든, 동시에 여러 번 호출해도 안전하다.
    //   첫 호출만 teardown 을 수행하고 나머지는 no-op.
    //   reason 이 없으면 ConnectionClosed 패킷에서 reason 필드를 생략한다.
    // -----------------------------------------------------------------------
    void close(std::optional<std::string> reason = std::nullopt);

    // send: ConnectionWriter 로 패킷 하나를 전송한다.
    [[nodiscard]] auto send(const Packet& packet) -> std::expected<void, ChatError>;

    [[nodiscard]] auto id()      const noexcept -> std::uint64_t { return ctx_.connection_id; }
    [[nodiscard]] auto context() const noexcept -> const ConnectionContext& { return ctx_; }
    [[nodiscard]] auto state()   const noexcept -> ConnectionState {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] auto invalid_packets() const noexcept -> std::uint32_t {
        return invalid_packets_.load(std::memory_order_acquire);
    }

private:
    ConnectionHandler(Stream stream, ConnectionContext ctx, Dependencies deps);

    auto run() -> boost::asio::awaitable<void>;
    auto read_loop() -> boost::asio::awaitable<void>;
    auto refresh_loop() -> boost::asio::awaitable<void>;

    // handshake 판정. ACTIVE 로 진행해도 되면 true.
    bool handshake();

    // 수신 레코드 하나 처리. 연결을 계속 읽어야 하면 true.
    bool handle_record(PacketStreamParser::Item item);

    void refresh_settings();

    // close 요청 공통 경로: 첫 요청만 strand 에서 teardown 을 실행한다.
    void request_close(std::optional<std::string> reason, ConnectionState terminal);
    void teardown(const std::optional<std::string>& reason, ConnectionState terminal);

    [[nodiscard]] bool close_requested() const noexcept {
        return close_requested_.load(std::memory_order_acquire);
    }

    Stream             stream_;
    ConnectionWriter   writer_;
    ConnectionContext  ctx_;

    ConnectionListener& listener_;
    SettingsStore&      settings_;
    MessageRouter&      router_;
    StructuredLogger&   logger_;
    ConnectionStats&    stats_;

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    boost::asio::steady_timer                         refresh_timer_;

    // strand 전용
    PacketStreamParser        parser_{};
    std::chrono::milliseconds refresh_interval_{kDefaultConnectionRefreshIntervalMillis};
    std::int32_t              retry_limit_{kDefaultRetriesOnInvalidPackets};
    bool                      torn_down_{false};

    std::atomic<ConnectionState> state_{ConnectionState::kHandshake};
    std::atomic<std::uint32_t>   invalid_packets_{0};

    // close() 중복 호출 방지용 atomic 플래그
    std::atomic<bool>            close_requested_{false};
};
