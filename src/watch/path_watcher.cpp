#include "watch/path_watcher.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <sys/inotify.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <vector>

namespace {

// 디렉터리 안의 생성/수정/이동 + 디렉터리 자체 소실
constexpr std::uint32_t kWatchMask =
    IN_CREATE | IN_MODIFY | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF;

// 감시가 더 이상 유효하지 않음을 뜻하는 비트
constexpr std::uint32_t kWatchLostMask = IN_IGNORED | IN_DELETE_SELF | IN_MOVE_SELF;

}  // namespace

// ---------------------------------------------------------------------------
// PathWatcher 생성자
// ---------------------------------------------------------------------------
PathWatcher::PathWatcher(std::filesystem::path directory,
                         EventCallback         on_event,
                         ErrorCallback         on_error)
    : directory_{std::move(directory)}
    , on_event_{std::move(on_event)}
    , on_error_{std::move(on_error)}
    , io_ctx_{1}
    , descriptor_{io_ctx_}
    , debounce_timer_{io_ctx_}
    , retry_timer_{io_ctx_}
{}

PathWatcher::~PathWatcher() {
    stop();
    std::lock_guard lock{lifecycle_mutex_};
    if (!thread_.joinable()) {
        return;
    }
    // 감시 스레드 위에서는 io_ctx_.run() 이 아직 스택에 있으므로 회수할 수 없다
    if (thread_.get_id() == std::this_thread::get_id()) {
        spdlog::critical("[watcher] '{}' destroyed from its own callback", directory_.string());
        std::terminate();
    }
    // 콜백 안에서 stop() 된 경우 여기서 회수
    thread_.join();
}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------
void PathWatcher::start() {
    std::lock_guard lock{lifecycle_mutex_};
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    // 이전 실행의 스레드가 남아 있으면 회수
    if (thread_.joinable()) {
        thread_.join();
    }

    stop_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    io_ctx_.restart();

    boost::asio::co_spawn(
        io_ctx_,
        run(),
        [this](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[watcher] '{}' watch loop exception: {}",
                                  directory_.string(), e.what());
                }
            }
            close_descriptor();
        }
    );

    thread_ = std::thread([this] {
        io_ctx_.run();
        running_.store(false, std::memory_order_release);
    });

    spdlog::info("[watcher] started for '{}'", directory_.string());
}

void PathWatcher::pause() noexcept {
    paused_.store(true, std::memory_order_release);
}

void PathWatcher::resume() noexcept {
    paused_.store(false, std::memory_order_release);
}

// ---------------------------------------------------------------------------
// stop
//   1. stop_requested_ = true (코루틴은 매 재개 시점에 확인)
//   2. 감시 스레드에서 대기 중인 비동기 작업 cancel
//   3. 스레드 join (감시 스레드 자신이 호출한 경우 제외)
// ---------------------------------------------------------------------------
void PathWatcher::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    boost::asio::post(io_ctx_, [this] {
        boost::system::error_code ec;
        descriptor_.cancel(ec);
        debounce_timer_.cancel();
        retry_timer_.cancel();
    });

    std::lock_guard lock{lifecycle_mutex_};
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
        spdlog::info("[watcher] stopped for '{}'", directory_.string());
    }
}

// ---------------------------------------------------------------------------
// run
//   감시 설정 → 이벤트 루프 → (소실/오류 시) 1초 후 재설정 반복.
// ---------------------------------------------------------------------------
auto PathWatcher::run() -> boost::asio::awaitable<void> {
    while (!stop_requested()) {
        auto established = establish_watch();
        if (established) {
            watching_.store(true, std::memory_order_release);
            co_await read_events();
            watching_.store(false, std::memory_order_release);
            close_descriptor();
            if (stop_requested()) {
                break;
            }
        } else {
            report_error(std::move(established.error()));
        }

        boost::system::error_code ec;
        retry_timer_.expires_after(kRetryDelay);
        co_await retry_timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec && ec != boost::asio::error::operation_aborted) {
            spdlog::warn("[watcher] retry timer error: {}", ec.message());
        }
    }
    co_return;
}

// ---------------------------------------------------------------------------
// establish_watch
// ---------------------------------------------------------------------------
auto PathWatcher::establish_watch() -> std::expected<void, ChatError> {
    const int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return std::unexpected(ChatError{
            ErrorCode::kWatchFailed, "inotify_init1 failed", std::strerror(err)});
    }

    const int wd = ::inotify_add_watch(fd, directory_.c_str(), kWatchMask);
    if (wd < 0) {
        const int err = errno;
        ::close(fd);
        return std::unexpected(ChatError{
            ErrorCode::kWatchFailed,
            fmt::format("cannot watch '{}'", directory_.string()),
            std::strerror(err)});
    }

    boost::system::error_code ec;
    descriptor_.assign(fd, ec);
    if (ec) {
        ::close(fd);
        return std::unexpected(ChatError{
            ErrorCode::kWatchFailed, "cannot assign inotify descriptor", ec.message()});
    }

    // 동기 read_some 이 would_block 을 즉시 반환하도록
    descriptor_.non_blocking(true, ec);
    if (ec) {
        close_descriptor();
        return std::unexpected(ChatError{
            ErrorCode::kWatchFailed, "cannot set inotify descriptor non-blocking",
            ec.message()});
    }

    watch_descriptor_ = wd;
    spdlog::debug("[watcher] watching '{}' (wd={})", directory_.string(), wd);
    return {};
}

// ---------------------------------------------------------------------------
// read_events
// ---------------------------------------------------------------------------
auto PathWatcher::read_events() -> boost::asio::awaitable<void> {
    while (!stop_requested()) {
        boost::system::error_code ec;
        co_await descriptor_.async_wait(
            boost::asio::posix::stream_descriptor::wait_read,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (stop_requested()) {
            co_return;
        }
        if (ec) {
            report_error(ChatError{
                ErrorCode::kWatchFailed,
                fmt::format("wait on '{}' failed", directory_.string()),
                ec.message()});
            co_return;
        }

        // quiescence: 연속 알림을 한 배치로 모은다
        debounce_timer_.expires_after(kDebounceWindow);
        co_await debounce_timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (stop_requested()) {
            co_return;
        }

        if (!drain_events()) {
            report_error(ChatError{
                ErrorCode::kWatchFailed,
                fmt::format("watch on '{}' lost", directory_.string()),
                "directory removed or moved"});
            co_return;
        }
    }
}

// ---------------------------------------------------------------------------
// drain_events
//   같은 배치 안의 동일 (kind, path) 이벤트는 한 번만 처리한다.
// ---------------------------------------------------------------------------
bool PathWatcher::drain_events() {
    alignas(inotify_event) std::array<char, 4096> buf{};
    std::vector<WatchEvent> batch;
    bool alive = true;

    while (true) {
        boost::system::error_code ec;
        const std::size_t n = descriptor_.read_some(boost::asio::buffer(buf), ec);
        if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
            break;
        }
        if (ec) {
            spdlog::warn("[watcher] read error on '{}': {}", directory_.string(), ec.message());
            alive = false;
            break;
        }

        std::size_t offset = 0;
        while (offset + sizeof(inotify_event) <= n) {
            const auto* raw = reinterpret_cast<const inotify_event*>(buf.data() + offset);
            offset += sizeof(inotify_event) + raw->len;

            if ((raw->mask & kWatchLostMask) != 0) {
                alive = false;
                continue;
            }

            WatchEvent event{};
            if ((raw->mask & IN_Q_OVERFLOW) != 0) {
                event = WatchEvent{WatchEventKind::kOther, directory_};
            } else if ((raw->mask & IN_CREATE) != 0) {
                event = WatchEvent{WatchEventKind::kCreated, directory_ / raw->name};
            } else if ((raw->mask & IN_MODIFY) != 0) {
                event = WatchEvent{WatchEventKind::kModified, directory_ / raw->name};
            } else if ((raw->mask & IN_MOVED_TO) != 0) {
                event = WatchEvent{WatchEventKind::kOther, directory_ / raw->name};
            } else {
                continue;
            }

            const bool duplicate = std::any_of(batch.begin(), batch.end(),
                [&event](const WatchEvent& seen) {
                    return seen.kind == event.kind && seen.path == event.path;
                });
            if (!duplicate) {
                batch.push_back(std::move(event));
            }
        }
    }

    const auto now = CreateModifyFilter::Clock::now();

    // 일시정지 중에는 읽기만 하고 버린다
    if (!paused()) {
        for (const auto& event : batch) {
            if (filter_.should_dispatch(event, now)) {
                dispatch(event);
            } else {
                spdlog::debug("[watcher] suppressed {} for '{}'",
                              watch_event_kind_name(event.kind), event.path.string());
            }
        }
    }
    filter_.prune(now);

    return alive;
}

void PathWatcher::dispatch(const WatchEvent& event) {
    spdlog::debug("[watcher] {} '{}'", watch_event_kind_name(event.kind), event.path.string());
    if (!on_event_) {
        return;
    }
    try {
        on_event_(event);
    } catch (const std::exception& e) {
        spdlog::error("[watcher] event callback failed for '{}': {}",
                      event.path.string(), e.what());
    }
}

void PathWatcher::report_error(ChatError error) {
    spdlog::warn("[watcher] {}: {}", error.message, error.context);
    if (!on_error_) {
        return;
    }
    try {
        on_error_(error);
    } catch (const std::exception& e) {
        spdlog::error("[watcher] error callback failed: {}", e.what());
    }
}

void PathWatcher::close_descriptor() noexcept {
    boost::system::error_code ec;
    if (descriptor_.is_open()) {
        // fd 를 닫으면 등록된 watch 도 함께 제거된다
        descriptor_.cancel(ec);
        descriptor_.close(ec);
    }
    watch_descriptor_ = -1;
}
