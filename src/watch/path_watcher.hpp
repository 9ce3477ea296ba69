#pragma once

// ---------------------------------------------------------------------------
// path_watcher.hpp
//
// 디렉터리 하나의 create/modify 활동을 감시해 debounce 된 이벤트를 콜백으로 전달.
//
// [실행 모델]
// - 자체 io_context 와 전용 스레드 1개. 모든 콜백은 이 스레드에서만 호출된다.
// - inotify fd 를 posix::stream_descriptor 로 감싸 async_wait 로 대기한다.
//   대기/타이머는 stop() 에서 cancel 되므로 종료가 외부 활동에 의존하지 않는다.
//
// [Debounce]
// - fd 가 readable 이 되면 kDebounceWindow(100ms) 동안 기다린 뒤
//   그동안 쌓인 이벤트를 한 번에 읽는다.
// - CREATE 직후의 MODIFY 는 CreateModifyFilter 가 억제한다.
//
// [오류 처리]
// - 감시 설정 실패/감시 대상 소실/읽기 오류는 ErrorCallback 으로 보고하고
//   kRetryDelay(1s) 후 감시를 다시 설정한다. stop() 이후에는 재시도하지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "watch/watch_event.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>

class PathWatcher {
public:
    using EventCallback = std::function<void(const WatchEvent&)>;
    using ErrorCallback = std::function<void(const ChatError&)>;

    static constexpr std::chrono::milliseconds kDebounceWindow{100};
    static constexpr std::chrono::milliseconds kRetryDelay{1000};

    // -----------------------------------------------------------------------
    // 생성자
    //   directory : 감시할 디렉터리. 이벤트 path 는 directory / 파일명.
    //   on_event  : dispatch 대상 이벤트 콜백
    //   on_error  : 감시 오류 콜백 (nullptr 이면 로그만 남긴다)
    // -----------------------------------------------------------------------
    PathWatcher(std::filesystem::path directory,
                EventCallback         on_event,
                ErrorCallback         on_error);

    // stop() 후 스레드 join.
    // 콜백 안(감시 스레드)에서 소멸시키면 std::terminate. 콜백은 stop() 만 호출하고
    // 소멸은 다른 스레드에서 한다.
    ~PathWatcher();

    PathWatcher(const PathWatcher&)            = delete;
    PathWatcher& operator=(const PathWatcher&) = delete;
    PathWatcher(PathWatcher&&)                 = delete;
    PathWatcher& operator=(PathWatcher&&)      = delete;

    // start: 감시 스레드를 시작한다. 이미 실행 중이면 no-op.
    void start();

    // pause/resume: dispatch 여부만 바꾼다. 일시정지 중에도 이벤트는 읽어서 버린다.
    void pause() noexcept;
    void resume() noexcept;

    // -----------------------------------------------------------------------
    // stop
    //   대기 중인 async_wait/타이머를 cancel 하고 스레드 종료를 기다린다.
    //   콜백 안(감시 스레드)에서 호출하면 join 하지 않고 종료 신호만 보낸다.
    //   여러 번 호출해도 안전하다.
    // -----------------------------------------------------------------------
    void stop();

    [[nodiscard]] bool running()  const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] bool paused()   const noexcept { return paused_.load(std::memory_order_acquire); }

    // 현재 inotify 감시가 설정되어 있으면 true
    [[nodiscard]] bool watching() const noexcept { return watching_.load(std::memory_order_acquire); }

    [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& { return directory_; }

private:
    auto run() -> boost::asio::awaitable<void>;

    // 감시 설정: inotify fd 생성 + 디렉터리 등록 → descriptor_ 에 할당
    auto establish_watch() -> std::expected<void, ChatError>;

    // 감시가 유지되는 동안 이벤트를 읽어 dispatch. 감시 소실/오류 시 반환.
    auto read_events() -> boost::asio::awaitable<void>;

    // 대기 중인 이벤트를 모두 읽어 dispatch. 감시 대상이 사라졌으면 false.
    bool drain_events();

    void dispatch(const WatchEvent& event);
    void report_error(ChatError error);
    void close_descriptor() noexcept;

    [[nodiscard]] bool stop_requested() const noexcept {
        return stop_requested_.load(std::memory_order_acquire);
    }

    std::filesystem::path directory_;
    EventCallback         on_event_;
    ErrorCallback         on_error_;

    boost::asio::io_context                 io_ctx_;
    boost::asio::posix::stream_descriptor   descriptor_;
    boost::asio::steady_timer               debounce_timer_;
    boost::asio::steady_timer               retry_timer_;
    int                                     watch_descriptor_{-1};

    // 감시 스레드 전용
    CreateModifyFilter filter_{};

    std::mutex        lifecycle_mutex_;  // start/stop 직렬화
    std::thread       thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> watching_{false};
    std::atomic<bool> stop_requested_{false};
};
