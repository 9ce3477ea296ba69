#include "server/chat_server.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

namespace {

constexpr std::chrono::milliseconds kDrainPollInterval{20};
constexpr const char*               kShutdownReason = "server shutting down";

}  // namespace

// ---------------------------------------------------------------------------
// ChatServer 생성자
// ---------------------------------------------------------------------------
ChatServer::ChatServer(std::filesystem::path config_dir, StructuredLogger& logger)
    : ChatServer(std::move(config_dir), logger, std::make_unique<LoggingMessageRouter>())
{}

ChatServer::ChatServer(std::filesystem::path          config_dir,
                       StructuredLogger&              logger,
                       std::unique_ptr<MessageRouter> router)
    : config_dir_{std::move(config_dir)}
    , logger_{logger}
    , router_{std::move(router)}
    , io_ctx_{}
    , reloader_{config_dir_, settings_, access_}
    , stop_signals_{io_ctx_, SIGTERM, SIGINT}
    , hup_signals_{io_ctx_, SIGHUP}
    , drain_timer_{io_ctx_}
{}

ChatServer::~ChatServer() {
    if (watcher_) {
        watcher_->stop();
    }
}

// ---------------------------------------------------------------------------
// init
//   1. 설정 디렉터리 전체 로드 (server.yaml 없음/오류 → 기동 실패)
//   2. ConnectionListener 생성 + listen (bind 실패 → 기동 실패)
//   3. PathWatcher 생성 (설정 디렉터리 감시 → ConfigReloader)
// ---------------------------------------------------------------------------
auto ChatServer::init() -> std::expected<void, std::string> {
    if (auto loaded = reloader_.reload_all(); !loaded) {
        return std::unexpected(fmt::format("failed to load configuration from '{}': {}",
                                           config_dir_.string(), loaded.error()));
    }

    const auto settings = settings_.current();

    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(settings->listen_address, ec);
    if (ec) {
        return std::unexpected(fmt::format("invalid listen_address '{}': {}",
                                           settings->listen_address, ec.message()));
    }

    listener_ = std::make_unique<ConnectionListener>(
        io_ctx_, access_, settings_, *router_, logger_, stats_);

    if (auto listening = listener_->listen({address, settings->port}); !listening) {
        return std::unexpected(fmt::format("{}: {}",
                                           listening.error().message,
                                           listening.error().context));
    }

    watcher_ = std::make_unique<PathWatcher>(
        config_dir_,
        [this](const WatchEvent& event) { reloader_.on_watch_event(event); },
        [this](const ChatError& error) { reloader_.on_watch_error(error); });

    return {};
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
void ChatServer::run() {
    if (!listener_ || !watcher_) {
        spdlog::error("[server] run() called before successful init()");
        return;
    }

    watcher_->start();
    listener_->start();
    install_signal_handlers();

    running_.store(true, std::memory_order_release);

    const auto threads = std::max<std::uint32_t>(settings_.current()->io_threads, 1);
    logger_.info(fmt::format("[server] started on {}:{} with {} I/O thread(s), config '{}'",
                             local_endpoint().address().to_string(), local_endpoint().port(),
                             threads, config_dir_.string()));

    std::vector<std::thread> pool;
    pool.reserve(threads - 1);
    for (std::uint32_t i = 1; i < threads; ++i) {
        pool.emplace_back([this] { io_ctx_.run(); });
    }
    io_ctx_.run();
    for (auto& t : pool) {
        t.join();
    }

    running_.store(false, std::memory_order_release);

    const auto snap = stats_.snapshot();
    logger_.info(fmt::format(
        "[server] stopped: total={} banned={} rejected={} invalid_packets={} routed_packets={}",
        snap.total_connections, snap.banned_connections, snap.rejected_connections,
        snap.invalid_packets, snap.routed_packets));
    logger_.flush();
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------
void ChatServer::stop() {
    if (stopping_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    boost::asio::post(io_ctx_, [this] { begin_shutdown(); });
}

void ChatServer::reload_all() {
    spdlog::info("[server] reloading configuration from '{}'", config_dir_.string());
    if (auto result = reloader_.reload_all(); !result) {
        spdlog::warn("[server] reload failed (keeping current configuration): {}",
                     result.error());
    }
}

auto ChatServer::local_endpoint() const -> boost::asio::ip::tcp::endpoint {
    return listener_ ? listener_->local_endpoint() : boost::asio::ip::tcp::endpoint{};
}

// ---------------------------------------------------------------------------
// install_signal_handlers
// ---------------------------------------------------------------------------
void ChatServer::install_signal_handlers() {
    stop_signals_.async_wait([this](const boost::system::error_code& ec, int signum) {
        if (!ec) {
            spdlog::info("[server] signal {} received, shutting down", signum);
            stop();
        }
    });
    wait_for_hup();
}

// SIGHUP 핸들러: 수신 후 재등록하여 반복 감지
void ChatServer::wait_for_hup() {
    hup_signals_.async_wait([this](const boost::system::error_code& ec, int /*signum*/) {
        if (!ec) {
            reload_all();
            wait_for_hup();
        }
    });
}

// ---------------------------------------------------------------------------
// begin_shutdown (io_context 위에서 실행)
// ---------------------------------------------------------------------------
void ChatServer::begin_shutdown() {
    logger_.info(fmt::format("[server] stopping, active connections: {}",
                             listener_ ? listener_->handler_count() : 0));

    if (watcher_) {
        watcher_->stop();
    }

    boost::system::error_code ec;
    stop_signals_.cancel(ec);
    hup_signals_.cancel(ec);

    if (!listener_) {
        io_ctx_.stop();
        return;
    }

    listener_->stop();
    listener_->close_all(kShutdownReason);

    boost::asio::co_spawn(
        io_ctx_,
        drain_connections(),
        [this](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[server] drain exception: {}", e.what());
                }
                io_ctx_.stop();
            }
        }
    );
}

// ---------------------------------------------------------------------------
// drain_connections
//   모든 연결이 registry 에서 빠지거나 grace 시간이 지나면 io_context 를 중단한다.
//   남은 연결의 자원은 io_context 와 listener 가 소멸할 때 해제된다.
// ---------------------------------------------------------------------------
auto ChatServer::drain_connections() -> boost::asio::awaitable<void> {
    const auto grace    = std::chrono::milliseconds{settings_.current()->shutdown_grace_millis};
    const auto deadline = std::chrono::steady_clock::now() + grace;

    while (listener_->handler_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        boost::system::error_code ec;
        drain_timer_.expires_after(kDrainPollInterval);
        co_await drain_timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            break;
        }
    }

    if (const auto remaining = listener_->handler_count(); remaining > 0) {
        logger_.warn(fmt::format("[server] {} connection(s) did not close within {}ms, forcing",
                                 remaining, grace.count()));
    } else {
        spdlog::info("[server] all connections closed, stopping io_context");
    }

    io_ctx_.stop();
}
