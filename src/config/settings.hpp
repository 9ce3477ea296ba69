#pragma once

// ---------------------------------------------------------------------------
// settings.hpp
//
// 서버 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 <config_dir>/server.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. YAML 에 없는 키는 기본값을 유지한다.
// - listen_address / port / io_threads 는 기동 시 한 번만 읽는다.
//   나머지는 Hot Reload 대상이다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>

// 외부 설정 값이 유효하지 않을 때 적용하는 기본값
inline constexpr std::int64_t kDefaultConnectionRefreshIntervalMillis = 1000;
inline constexpr std::int32_t kDefaultRetriesOnInvalidPackets         = 3;

// ---------------------------------------------------------------------------
// InternalSettings
//   연결 처리 내부 동작 값.
//   connection_refresh_interval_millis : 음수이면 기본값 적용
//   retries_on_invalid_packets         : 0 이하이면 기본값 적용
//   (검증은 SettingsStore 접근자에서 수행하며 여기 값은 원문 그대로 보관)
// ---------------------------------------------------------------------------
struct InternalSettings {
    std::int64_t connection_refresh_interval_millis{kDefaultConnectionRefreshIntervalMillis};
    std::int32_t retries_on_invalid_packets{kDefaultRetriesOnInvalidPackets};
};

// ---------------------------------------------------------------------------
// ServerSettings
//   server.yaml 의 루트 구조체.
// ---------------------------------------------------------------------------
struct ServerSettings {
    std::string      listen_address{"0.0.0.0"};
    std::uint16_t    port{13814};
    std::uint32_t    io_threads{4};
    std::uint32_t    shutdown_grace_millis{2000};
    bool             whitelist_enabled{false};
    InternalSettings internal{};
};
