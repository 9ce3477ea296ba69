#include "server/connection_listener.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <chrono>

// ---------------------------------------------------------------------------
// ConnectionListener 생성자
// ---------------------------------------------------------------------------
ConnectionListener::ConnectionListener(boost::asio::io_context& io_ctx,
                                       AccessControlStore&      access,
                                       SettingsStore&           settings,
                                       MessageRouter&           router,
                                       StructuredLogger&        logger,
                                       ConnectionStats&         stats)
    : io_ctx_{io_ctx}
    , access_{access}
    , settings_{settings}
    , router_{router}
    , logger_{logger}
    , stats_{stats}
    , acceptor_strand_{boost::asio::make_strand(io_ctx.get_executor())}
    , acceptor_{acceptor_strand_}
{}

// ---------------------------------------------------------------------------
// listen
// ---------------------------------------------------------------------------
auto ConnectionListener::listen(const boost::asio::ip::tcp::endpoint& endpoint)
    -> std::expected<void, ChatError>
{
    const auto fail = [&endpoint](std::string_view step, const boost::system::error_code& ec) {
        return std::unexpected(ChatError{
            ErrorCode::kIoError,
            fmt::format("{} failed for {}:{}", step,
                        endpoint.address().to_string(), endpoint.port()),
            ec.message()});
    };

    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return fail("open", ec);
    }
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        return fail("set_option(reuse_address)", ec);
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
        return fail("bind", ec);
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return fail("listen", ec);
    }

    local_endpoint_ = acceptor_.local_endpoint(ec);
    if (ec) {
        local_endpoint_ = endpoint;
    }

    spdlog::info("[listener] listening on {}:{}",
                 local_endpoint_.address().to_string(), local_endpoint_.port());
    return {};
}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------
void ConnectionListener::start() {
    boost::asio::co_spawn(
        acceptor_strand_,
        accept_loop(),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[listener] accept loop exception: {}", e.what());
                }
            }
        }
    );
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------
void ConnectionListener::stop() {
    if (stopping_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    boost::asio::post(acceptor_strand_, [this] {
        boost::system::error_code ec;
        acceptor_.cancel(ec);
        acceptor_.close(ec);
        if (ec) {
            spdlog::debug("[listener] acceptor close: {}", ec.message());
        }
    });
}

// ---------------------------------------------------------------------------
// accept_loop
// ---------------------------------------------------------------------------
auto ConnectionListener::accept_loop() -> boost::asio::awaitable<void> {
    while (!stopping()) {
        boost::system::error_code ec;

        // handler 마다 별도 strand 를 만들 수 있도록 io_context executor 로 생성
        boost::asio::ip::tcp::socket socket{io_ctx_};
        co_await acceptor_.async_accept(
            socket, boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec == boost::asio::error::operation_aborted || stopping()) {
                spdlog::info("[listener] acceptor closed");
                break;
            }
            spdlog::warn("[listener] accept error: {}", ec.message());
            continue;
        }

        if (stopping()) {
            boost::system::error_code close_ec;
            socket.close(close_ec);
            break;
        }

        ConnectionContext ctx{
            .connection_id = next_connection_id(),
            .connected_at  = std::chrono::system_clock::now(),
        };

        boost::system::error_code peer_ec;
        const auto remote_ep = socket.remote_endpoint(peer_ec);
        if (!peer_ec) {
            ctx.remote_address = remote_ep.address().to_string();
            ctx.remote_port    = remote_ep.port();
        } else {
            spdlog::debug("[listener] cannot resolve remote endpoint: {}", peer_ec.message());
        }

        // 생성 실패는 adopt_connection 안에서 보고된다
        if (auto handler = adopt_connection(Stream{std::move(socket)}, std::move(ctx)); handler) {
            spdlog::debug("[listener] new connection {}", (*handler)->id());
        }
    }
}

// ---------------------------------------------------------------------------
// adopt_connection
// ---------------------------------------------------------------------------
auto ConnectionListener::adopt_connection(Stream stream, ConnectionContext ctx)
    -> std::expected<std::shared_ptr<ConnectionHandler>, ChatError>
{
    const std::uint64_t   id          = ctx.connection_id;
    const std::string     remote_addr = ctx.remote_address;
    const std::uint16_t   remote_port = ctx.remote_port;

    auto created = ConnectionHandler::create(
        std::move(stream), std::move(ctx),
        ConnectionHandler::Dependencies{
            .listener = *this,
            .settings = settings_,
            .router   = router_,
            .logger   = logger_,
            .stats    = stats_,
        });

    if (!created) {
        logger_.error(fmt::format("[listener] {} ({})",
                                  created.error().message, created.error().context));
        logger_.log_connection(ConnectionLog{
            .connection_id  = id,
            .event          = ConnectionEvent::kRejected,
            .remote_address = remote_addr,
            .remote_port    = remote_port,
            .reason         = created.error().message,
            .timestamp      = std::chrono::system_clock::now(),
        });
        stats_.on_rejected();
        // stream 은 create() 에 move 되어 그 안에서 소멸(close) 됐다
        return std::unexpected(created.error());
    }

    auto handler = *created;
    register_handler(handler);

    // 등록 직후 종료가 시작된 경우에도 handler 는 스스로 teardown 한다
    handler->start();
    if (stopping()) {
        handler->close("server shutting down");
    }
    return handler;
}

bool ConnectionListener::is_banned(std::string_view address) const {
    return access_.is_banned(address);
}

bool ConnectionListener::is_whitelisted(std::string_view address) const {
    return access_.is_whitelisted(address);
}

// ---------------------------------------------------------------------------
// registry
// ---------------------------------------------------------------------------
bool ConnectionListener::register_handler(std::shared_ptr<ConnectionHandler> handler) {
    if (!handler) {
        return false;
    }

    const std::uint64_t id = handler->id();
    bool inserted = false;
    {
        std::lock_guard lock{registry_mutex_};
        inserted = handlers_.emplace(id, std::move(handler)).second;
    }

    if (inserted) {
        stats_.on_connection_open();
    } else {
        spdlog::warn("[listener] connection {} already registered", id);
    }
    return inserted;
}

bool ConnectionListener::unregister_handler(std::uint64_t connection_id) {
    std::size_t erased = 0;
    std::size_t remaining = 0;
    {
        std::lock_guard lock{registry_mutex_};
        erased    = handlers_.erase(connection_id);
        remaining = handlers_.size();
    }

    if (erased == 0) {
        return false;
    }

    stats_.on_connection_close();
    spdlog::debug("[listener] connection {} removed (active: {})", connection_id, remaining);
    return true;
}

auto ConnectionListener::find_handler(std::uint64_t connection_id) const
    -> std::shared_ptr<ConnectionHandler>
{
    std::lock_guard lock{registry_mutex_};
    const auto it = handlers_.find(connection_id);
    return it == handlers_.end() ? nullptr : it->second;
}

auto ConnectionListener::handler_count() const -> std::size_t {
    std::lock_guard lock{registry_mutex_};
    return handlers_.size();
}

// ---------------------------------------------------------------------------
// close_all
//   close() 는 teardown 중 unregister_handler() 로 registry 락을 다시 잡을 수
//   있으므로 복사본을 만든 뒤 락 밖에서 호출한다.
// ---------------------------------------------------------------------------
void ConnectionListener::close_all(const std::string& reason) {
    std::vector<std::shared_ptr<ConnectionHandler>> snapshot;
    {
        std::lock_guard lock{registry_mutex_};
        snapshot.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            snapshot.push_back(handler);
        }
    }

    spdlog::info("[listener] closing {} connection(s): {}", snapshot.size(), reason);
    for (const auto& handler : snapshot) {
        handler->close(reason);
    }
}

auto ConnectionListener::local_endpoint() const -> boost::asio::ip::tcp::endpoint {
    return local_endpoint_;
}
