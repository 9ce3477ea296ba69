#pragma once

// ---------------------------------------------------------------------------
// watch_event.hpp
//
// PathWatcher 가 콜백으로 전달하는 이벤트와 create→modify 억제 필터.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <unordered_map>

enum class WatchEventKind : std::uint8_t {
    kCreated  = 0,
    kModified = 1,
    kOther    = 2,  // rename-into (IN_MOVED_TO), queue overflow 등
};

[[nodiscard]] constexpr auto watch_event_kind_name(WatchEventKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case WatchEventKind::kCreated:  return "CREATED";
        case WatchEventKind::kModified: return "MODIFIED";
        case WatchEventKind::kOther:    return "OTHER";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// WatchEvent
//   값 타입. 콜백에서 필요하면 복사해 보관한다.
//   PathWatcher 는 dispatch 후 이벤트를 보관하지 않는다.
// ---------------------------------------------------------------------------
struct WatchEvent {
    WatchEventKind        kind{WatchEventKind::kOther};
    std::filesystem::path path{};
};

// ---------------------------------------------------------------------------
// CreateModifyFilter
//   CREATE 직후 같은 경로에 따라오는 MODIFY 를 억제한다.
//
//   - kCreated  : (path, now) 기록 후 dispatch
//   - kModified : 기록이 없거나 window 보다 오래됐으면 dispatch + 기록 제거,
//                 window 이내면 억제
//   - kOther    : 항상 dispatch
//
//   PathWatcher 의 실행 컨텍스트 전용. 스레드 안전성 없음.
// ---------------------------------------------------------------------------
class CreateModifyFilter {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kSuppressWindow{100};

    explicit CreateModifyFilter(std::chrono::milliseconds window = kSuppressWindow)
        : window_(window) {}

    // should_dispatch: true 이면 이벤트를 콜백으로 전달해야 한다.
    [[nodiscard]] bool should_dispatch(const WatchEvent& event, Clock::time_point now);

    // prune: window 가 지난 기록을 제거한다.
    void prune(Clock::time_point now);

    [[nodiscard]] auto tracked() const noexcept -> std::size_t { return recently_created_.size(); }

private:
    struct PathHash {
        std::size_t operator()(const std::filesystem::path& p) const noexcept {
            return std::filesystem::hash_value(p);
        }
    };

    std::chrono::milliseconds window_;
    std::unordered_map<std::filesystem::path, Clock::time_point, PathHash> recently_created_{};
};
