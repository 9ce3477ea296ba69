#pragma once

#include "access/access_control_store.hpp"
#include "common/types.hpp"
#include "config/settings_store.hpp"
#include "logger/structured_logger.hpp"
#include "server/connection_handler.hpp"
#include "server/message_router.hpp"
#include "stats/connection_stats.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// ConnectionListener
//   TCP Accept → ConnectionHandler 생성/등록 → 실행을 담당한다.
//   ban/whitelist 조회를 AccessControlStore 에서 제공한다.
//
//   사용 예:
//     ConnectionListener listener{io_ctx, access, settings, router, logger, stats};
//     listener.listen(endpoint);   // bind 실패는 기동 실패
//     listener.start();            // accept 루프 co_spawn
//
//   스레드 안전성:
//     - registry 는 registry_mutex_ 로 보호한다. 여러 handler strand 와
//       accept 루프에서 동시에 등록/해제할 수 있다.
//     - acceptor 는 acceptor_strand_ 에서만 다룬다.
// ---------------------------------------------------------------------------
class ConnectionListener {
public:
    ConnectionListener(boost::asio::io_context& io_ctx,
                       AccessControlStore&      access,
                       SettingsStore&           settings,
                       MessageRouter&           router,
                       StructuredLogger&        logger,
                       ConnectionStats&         stats);

    ~ConnectionListener() = default;

    ConnectionListener(const ConnectionListener&)            = delete;
    ConnectionListener& operator=(const ConnectionListener&) = delete;
    ConnectionListener(ConnectionListener&&)                 = delete;
    ConnectionListener& operator=(ConnectionListener&&)      = delete;

    // -----------------------------------------------------------------------
    // listen
    //   acceptor open → reuse_address → bind → listen.
    //   실패 시: kIoError (기동 단계에서 치명적 오류로 취급)
    // -----------------------------------------------------------------------
    [[nodiscard]] auto listen(const boost::asio::ip::tcp::endpoint& endpoint)
        -> std::expected<void, ChatError>;

    // start: accept 루프를 co_spawn 한다. listen() 성공 후 호출.
    void start();

    // -----------------------------------------------------------------------
    // stop
    //   새 연결 accept 를 중단한다 (대기 중인 async_accept 취소).
    //   기존 연결은 close_all() 로 별도 종료한다.
    // -----------------------------------------------------------------------
    void stop();

    // -----------------------------------------------------------------------
    // adopt_connection
    //   이미 연결된 스트림 하나로 handler 를 생성 → 등록 → 시작한다.
    //   accept 루프가 사용하며, 로컬 소켓 쌍으로 연결을 주입할 때도 쓴다.
    //   생성 실패는 보고 후 스트림을 닫고 오류를 반환한다.
    // -----------------------------------------------------------------------
    auto adopt_connection(Stream stream, ConnectionContext ctx)
        -> std::expected<std::shared_ptr<ConnectionHandler>, ChatError>;

    // 접근 제어 조회 (어느 스레드에서든 안전)
    [[nodiscard]] bool is_banned(std::string_view address) const;
    [[nodiscard]] bool is_whitelisted(std::string_view address) const;

    // registry
    bool register_handler(std::shared_ptr<ConnectionHandler> handler);
    bool unregister_handler(std::uint64_t connection_id);
    [[nodiscard]] auto find_handler(std::uint64_t connection_id) const
        -> std::shared_ptr<ConnectionHandler>;
    [[nodiscard]] auto handler_count() const -> std::size_t;

    // close_all: 등록된 모든 handler 에 close(reason) 를 보낸다.
    void close_all(const std::string& reason);

    [[nodiscard]] auto next_connection_id() noexcept -> std::uint64_t {
        return next_connection_id_.fetch_add(1, std::memory_order_relaxed);
    }

    // bind 된 로컬 엔드포인트 (port 0 으로 listen 한 경우 실제 포트 확인용)
    [[nodiscard]] auto local_endpoint() const -> boost::asio::ip::tcp::endpoint;

    [[nodiscard]] bool stopping() const noexcept { return stopping_.load(std::memory_order_acquire); }

private:
    auto accept_loop() -> boost::asio::awaitable<void>;

    boost::asio::io_context& io_ctx_;
    AccessControlStore&      access_;
    SettingsStore&           settings_;
    MessageRouter&           router_;
    StructuredLogger&        logger_;
    ConnectionStats&         stats_;

    boost::asio::strand<boost::asio::any_io_executor> acceptor_strand_;
    boost::asio::ip::tcp::acceptor                    acceptor_;
    boost::asio::ip::tcp::endpoint                    local_endpoint_{};

    std::atomic<std::uint64_t> next_connection_id_{1};
    std::atomic<bool>          stopping_{false};

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<ConnectionHandler>> handlers_{};
};
