#pragma once

#include "access/access_control_store.hpp"
#include "config/config_reloader.hpp"
#include "config/settings_store.hpp"
#include "logger/structured_logger.hpp"
#include "server/connection_listener.hpp"
#include "server/message_router.hpp"
#include "stats/connection_stats.hpp"
#include "watch/path_watcher.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// ChatServer
//   설정 로드 → 저장소/리스너/감시자 구성 → 실행 → 제한 시간 내 종료.
//
//   사용 예:
//     ChatServer server{config_dir, logger};
//     if (auto r = server.init(); !r) { ... }   // 설정/바인드 실패는 기동 실패
//     server.run();                              // stop() 전까지 블록
//
//   시그널:
//     SIGTERM / SIGINT → stop()
//     SIGHUP           → reload_all()
//
//   Graceful Shutdown (stop):
//     1. PathWatcher 정지
//     2. accept 중단
//     3. 모든 연결에 close("server shutting down")
//     4. 연결이 모두 해제되거나 shutdown_grace_millis 가 지나면 io_context 중단
// ---------------------------------------------------------------------------
class ChatServer {
public:
    ChatServer(std::filesystem::path config_dir, StructuredLogger& logger);

    // router 를 주입하는 경우 (기본값은 LoggingMessageRouter)
    ChatServer(std::filesystem::path          config_dir,
               StructuredLogger&              logger,
               std::unique_ptr<MessageRouter> router);

    ~ChatServer();

    ChatServer(const ChatServer&)            = delete;
    ChatServer& operator=(const ChatServer&) = delete;
    ChatServer(ChatServer&&)                 = delete;
    ChatServer& operator=(ChatServer&&)      = delete;

    // -----------------------------------------------------------------------
    // init
    //   server.yaml (필수) + 주소 목록 로드 → listen.
    //   실패 시: 오류 문자열 (기동 중단)
    // -----------------------------------------------------------------------
    [[nodiscard]] auto init() -> std::expected<void, std::string>;

    // run: 감시자/시그널/accept 를 시작하고 io_context 를 io_threads 개 스레드로 실행한다.
    void run();

    // stop: 어느 스레드에서든 호출 가능. 두 번째 호출부터 no-op.
    void stop();

    // reload_all: 설정 디렉터리 전체 재로드 (SIGHUP)
    void reload_all();

    [[nodiscard]] auto local_endpoint() const -> boost::asio::ip::tcp::endpoint;
    [[nodiscard]] auto listener() noexcept -> ConnectionListener& { return *listener_; }
    [[nodiscard]] auto settings() noexcept -> SettingsStore& { return settings_; }
    [[nodiscard]] auto access() noexcept -> AccessControlStore& { return access_; }
    [[nodiscard]] auto stats() const noexcept -> const ConnectionStats& { return stats_; }
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

private:
    void install_signal_handlers();
    void wait_for_hup();
    void begin_shutdown();
    auto drain_connections() -> boost::asio::awaitable<void>;

    std::filesystem::path          config_dir_;
    StructuredLogger&              logger_;
    std::unique_ptr<MessageRouter> router_;

    boost::asio::io_context io_ctx_;
    SettingsStore           settings_{};
    AccessControlStore      access_{};
    ConnectionStats         stats_{};
    ConfigReloader          reloader_;

    std::unique_ptr<ConnectionListener> listener_{};
    std::unique_ptr<PathWatcher>        watcher_{};

    boost::asio::signal_set  stop_signals_;
    boost::asio::signal_set  hup_signals_;
    boost::asio::steady_timer drain_timer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
};
