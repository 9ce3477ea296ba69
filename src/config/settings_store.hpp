#pragma once

// ---------------------------------------------------------------------------
// settings_store.hpp
//
// 현재 ServerSettings 를 보관하고 연결 처리에 필요한 값을 해석해 제공한다.
//
// [Hot Reload]
// AccessControlStore 와 같은 방식: 불변 ServerSettings 스냅샷을
// std::atomic<std::shared_ptr<const ServerSettings>> 로 교체한다.
// 연결 handler 는 refresh 주기마다 접근자를 다시 호출해 최신 값을 얻는다.
// ---------------------------------------------------------------------------

#include "config/settings.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

// ---------------------------------------------------------------------------
// resolve_refresh_interval
//   음수이면 기본값(1000ms). 0 은 그대로 허용한다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto resolve_refresh_interval(std::int64_t raw_millis) noexcept
    -> std::chrono::milliseconds;

// ---------------------------------------------------------------------------
// resolve_retry_limit
//   0 이하이면 기본값(3).
// ---------------------------------------------------------------------------
[[nodiscard]] auto resolve_retry_limit(std::int32_t raw) noexcept -> std::int32_t;

class SettingsStore {
public:
    SettingsStore();
    explicit SettingsStore(ServerSettings initial);

    ~SettingsStore() = default;

    SettingsStore(const SettingsStore&)            = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;
    SettingsStore(SettingsStore&&)                 = delete;
    SettingsStore& operator=(SettingsStore&&)      = delete;

    [[nodiscard]] auto current() const -> std::shared_ptr<const ServerSettings>;

    // reload: 전체 교체. 부분 갱신 상태는 관찰되지 않는다.
    void reload(ServerSettings next);

    [[nodiscard]] auto connection_refresh_interval() const -> std::chrono::milliseconds;
    [[nodiscard]] auto retries_on_invalid_packets() const -> std::int32_t;

private:
    std::atomic<std::shared_ptr<const ServerSettings>> current_;
};
