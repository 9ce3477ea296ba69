#include "server/connection_handler.hpp"

#include "server/connection_listener.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <algorithm>
#include <array>

// ---------------------------------------------------------------------------
// ConnectionHandler 구현
//
// 흐름:
//   1. "<addr> tries to establish a connection" 보고
//   2. handshake: banned → Banned 전송 후 종료 (kBanned)
//                 not whitelisted → NotWhitelisted 전송 후 종료 (kRejected)
//   3. kActive → log_connection(connect) → refresh_loop spawn
//   4. 수신 루프: read → PacketStreamParser → route / invalid 카운트
//   5. EOF / 오류 / 예외 / 외부 close → teardown
//   6. teardown: 보고 → ConnectionClosed 전송 + writer close (상한 있음)
//                → 수신 shutdown → 소켓 close → 상태 확정 → registry 해제
// ---------------------------------------------------------------------------

namespace {

constexpr std::size_t kReadBufferSize = 4096;

// 0ms 주기 타이머가 strand 를 독점하지 않도록 하한을 둔다
constexpr std::chrono::milliseconds kMinRefreshInterval{1};

// teardown 이 다른 send() 의 완료를 기다리는 최대 시간
constexpr std::chrono::milliseconds kFinalSendWait{200};

ConnectionEvent terminal_event(ConnectionState terminal) noexcept {
    switch (terminal) {
        case ConnectionState::kBanned:   return ConnectionEvent::kBanned;
        case ConnectionState::kRejected: return ConnectionEvent::kNotWhitelisted;
        default:                         return ConnectionEvent::kDisconnect;
    }
}

}  // namespace

auto connection_state_name(ConnectionState state) noexcept -> std::string_view {
    switch (state) {
        case ConnectionState::kHandshake: return "HANDSHAKE";
        case ConnectionState::kActive:    return "ACTIVE";
        case ConnectionState::kClosing:   return "CLOSING";
        case ConnectionState::kClosed:    return "CLOSED";
        case ConnectionState::kBanned:    return "BANNED";
        case ConnectionState::kRejected:  return "REJECTED";
    }
    return "UNKNOWN";
}

bool is_terminal(ConnectionState state) noexcept {
    return state == ConnectionState::kClosed
        || state == ConnectionState::kBanned
        || state == ConnectionState::kRejected;
}

// ---------------------------------------------------------------------------
// create
// ---------------------------------------------------------------------------
auto ConnectionHandler::create(Stream stream, ConnectionContext ctx, Dependencies deps)
    -> std::expected<std::shared_ptr<ConnectionHandler>, ChatError>
{
    if (!stream.is_open()) {
        return std::unexpected(ChatError{
            ErrorCode::kInvalidStream,
            fmt::format("could not connect to [{}]: the stream is not open", ctx.remote_address),
            fmt::format("connection_id={}", ctx.connection_id)});
    }

    // 생성자가 private 이므로 make_shared 대신 직접 생성
    return std::shared_ptr<ConnectionHandler>(
        new ConnectionHandler(std::move(stream), std::move(ctx), deps));
}

ConnectionHandler::ConnectionHandler(Stream stream, ConnectionContext ctx, Dependencies deps)
    : stream_{std::move(stream)}
    , writer_{stream_}
    , ctx_{std::move(ctx)}
    , listener_{deps.listener}
    , settings_{deps.settings}
    , router_{deps.router}
    , logger_{deps.logger}
    , stats_{deps.stats}
    , strand_{boost::asio::make_strand(stream_.get_executor())}
    , refresh_timer_{strand_}
{}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------
void ConnectionHandler::start() {
    auto self = shared_from_this();
    boost::asio::co_spawn(
        strand_,
        [self]() { return self->run(); },
        [self](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    self->logger_.error(fmt::format(
                        "[conn {}] handler exception: {}", self->id(), e.what()));
                }
            }
            // 어떤 경로로 끝나든 teardown 은 반드시 한 번 수행
            self->close();
        }
    );
}

void ConnectionHandler::close(std::optional<std::string> reason) {
    request_close(std::move(reason), ConnectionState::kClosed);
}

auto ConnectionHandler::send(const Packet& packet) -> std::expected<void, ChatError> {
    return writer_.send(packet);
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
auto ConnectionHandler::run() -> boost::asio::awaitable<void> {
    logger_.info(fmt::format("[conn {}] {} tries to establish a connection to the server",
                             id(), ctx_.remote_address));

    if (!handshake()) {
        co_return;
    }

    state_.store(ConnectionState::kActive, std::memory_order_release);
    logger_.log_connection(ConnectionLog{
        .connection_id  = ctx_.connection_id,
        .event          = ConnectionEvent::kConnect,
        .remote_address = ctx_.remote_address,
        .remote_port    = ctx_.remote_port,
        .timestamp      = std::chrono::system_clock::now(),
    });

    refresh_settings();

    auto self = shared_from_this();
    boost::asio::co_spawn(
        strand_,
        [self]() { return self->refresh_loop(); },
        [self](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    self->logger_.error(fmt::format(
                        "[conn {}] refresh loop exception: {}", self->id(), e.what()));
                }
            }
        }
    );

    std::optional<std::string> failure;
    try {
        co_await read_loop();
    } catch (const std::exception& e) {
        // catch 블록 안에서는 co_await 불가 → 사유만 기록하고 아래에서 종료
        failure = fmt::format("An error occurred while connected to [{}]: {}",
                              ctx_.remote_address, e.what());
    }

    if (failure) {
        logger_.error(fmt::format("[conn {}] {}", id(), *failure));
        close("internal error");
    }
    co_return;
}

// ---------------------------------------------------------------------------
// handshake
//   ban 판정이 whitelist 판정보다 먼저다.
// ---------------------------------------------------------------------------
bool ConnectionHandler::handshake() {
    if (close_requested()) {
        return false;
    }

    if (listener_.is_banned(ctx_.remote_address)) {
        stats_.on_banned();
        if (auto sent = writer_.send(Packet::banned()); !sent) {
            logger_.warn(fmt::format("[conn {}] failed to send Banned: {}",
                                     id(), sent.error().context));
        }
        request_close("banned", ConnectionState::kBanned);
        return false;
    }

    if (!listener_.is_whitelisted(ctx_.remote_address)) {
        stats_.on_rejected();
        if (auto sent = writer_.send(Packet::not_whitelisted()); !sent) {
            logger_.warn(fmt::format("[conn {}] failed to send NotWhitelisted: {}",
                                     id(), sent.error().context));
        }
        request_close("not whitelisted", ConnectionState::kRejected);
        return false;
    }

    return !close_requested();
}

// ---------------------------------------------------------------------------
// read_loop
// ---------------------------------------------------------------------------
auto ConnectionHandler::read_loop() -> boost::asio::awaitable<void> {
    std::array<char, kReadBufferSize> buf{};

    while (!close_requested()) {
        boost::system::error_code ec;
        const std::size_t n = co_await stream_.async_read_some(
            boost::asio::buffer(buf),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec == boost::asio::error::eof) {
                spdlog::debug("[conn {}] peer closed the connection", id());
                close();
            } else if (ec == boost::asio::error::operation_aborted || close_requested()) {
                // close() 로 인한 취소
            } else {
                logger_.warn(fmt::format("[conn {}] read error: {}", id(), ec.message()));
                close("I/O error");
            }
            co_return;
        }

        parser_.feed(std::string_view{buf.data(), n});
        while (auto item = parser_.next()) {
            if (!handle_record(std::move(*item))) {
                co_return;
            }
        }
    }
}

// ---------------------------------------------------------------------------
// handle_record
//   malformed 누적 횟수가 retry_limit_ 에 도달하면 종료한다.
//   (limit 이 3 이면 2개까지는 유지, 3번째에서 종료)
// ---------------------------------------------------------------------------
bool ConnectionHandler::handle_record(PacketStreamParser::Item item) {
    if (close_requested()) {
        return false;
    }

    if (item) {
        stats_.on_packet_routed();
        router_.route(ctx_, *item);
        return !close_requested();
    }

    const auto& err   = item.error();
    const auto  count = invalid_packets_.fetch_add(1, std::memory_order_acq_rel) + 1;
    stats_.on_invalid_packet();

    spdlog::warn("[conn {}] invalid packet {}/{}: {} ({})",
                 id(), count, retry_limit_, err.message, err.context);

    if (static_cast<std::int64_t>(count) >= retry_limit_) {
        close("too many invalid packets");
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// refresh_loop
//   refresh 주기마다 SettingsStore 에서 주기/재시도 한도를 다시 읽는다.
// ---------------------------------------------------------------------------
auto ConnectionHandler::refresh_loop() -> boost::asio::awaitable<void> {
    while (!close_requested()) {
        boost::system::error_code ec;
        refresh_timer_.expires_after(std::max(refresh_interval_, kMinRefreshInterval));
        co_await refresh_timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec || close_requested()) {
            co_return;
        }
        refresh_settings();
    }
}

void ConnectionHandler::refresh_settings() {
    refresh_interval_ = settings_.connection_refresh_interval();
    retry_limit_      = settings_.retries_on_invalid_packets();
}

// ---------------------------------------------------------------------------
// request_close
//   close_requested_ 를 선점한 호출만 teardown 을 strand 에 넘긴다.
//   strand 안에서 호출되면 dispatch 가 즉시 실행한다.
// ---------------------------------------------------------------------------
void ConnectionHandler::request_close(std::optional<std::string> reason,
                                      ConnectionState             terminal)
{
    if (close_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto self = shared_from_this();
    boost::asio::dispatch(strand_, [self, reason = std::move(reason), terminal]() {
        self->teardown(reason, terminal);
    });
}

// ---------------------------------------------------------------------------
// teardown
//   개별 해제 실패는 info 로만 남기고 나머지 해제를 계속한다.
// ---------------------------------------------------------------------------
void ConnectionHandler::teardown(const std::optional<std::string>& reason,
                                 ConnectionState                   terminal)
{
    if (torn_down_) {
        return;
    }
    torn_down_ = true;
    state_.store(ConnectionState::kClosing, std::memory_order_release);

    // 1. 보고. 상대가 EOF 를 보거나 상태가 확정되기 전에 기록되어야 한다.
    logger_.log_connection(ConnectionLog{
        .connection_id   = ctx_.connection_id,
        .event           = terminal_event(terminal),
        .remote_address  = ctx_.remote_address,
        .remote_port     = ctx_.remote_port,
        .reason          = reason,
        .invalid_packets = invalid_packets(),
        .timestamp       = std::chrono::system_clock::now(),
    });
    logger_.info(fmt::format("[conn {}] Closing connection with {}{}", id(), ctx_.remote_address,
                             reason ? fmt::format(" Reason: {}", *reason) : std::string{}));

    // 2. ConnectionClosed (마지막 패킷) + writer close. 상대가 읽지 않으면 버린다.
    if (auto closed = writer_.close_with(Packet::connection_closed(reason), kFinalSendWait);
        !closed)
    {
        logger_.info(fmt::format("[conn {}] info while closing connection to [{}]: {} ({})",
                                 id(), ctx_.remote_address,
                                 closed.error().message, closed.error().context));
    }

    // 3. 수신 방향
    boost::system::error_code ec;
    stream_.shutdown(Stream::shutdown_receive, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        logger_.info(fmt::format("[conn {}] info while shutting down receive: {}",
                                 id(), ec.message()));
    }

    // 4. 연결 자체 (대기 중인 read 는 operation_aborted 로 깨어난다)
    refresh_timer_.cancel();
    stream_.close(ec);
    if (ec) {
        logger_.info(fmt::format("[conn {}] info while closing socket: {}", id(), ec.message()));
    }

    state_.store(terminal, std::memory_order_release);

    if (!listener_.unregister_handler(id())) {
        spdlog::debug("[conn {}] was not registered", id());
    }
}
