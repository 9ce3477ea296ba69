#pragma once

// ---------------------------------------------------------------------------
// config_reloader.hpp
//
// 설정 디렉터리의 변경을 해당 저장소(SettingsStore / AccessControlStore) 에 반영한다.
//
//   server.yaml    → SettingsStore::reload + whitelist 활성 여부
//   banned.yaml    → AccessControlStore::replace_banned
//   whitelist.yaml → AccessControlStore::replace_whitelist
//   그 외 파일     → 무시
//
// [실패 처리]
// 로드 실패 시 현재 상태를 유지하고 경고 로그만 남긴다 (부분 적용 없음).
//
// [호출 컨텍스트]
// PathWatcher 스레드(on_watch_event) 와 SIGHUP 핸들러(reload_all) 에서 호출된다.
// 저장소 갱신은 각 저장소가 직렬화하므로 여기서는 별도 락이 없다.
// ---------------------------------------------------------------------------

#include "access/access_control_store.hpp"
#include "common/types.hpp"
#include "config/settings_store.hpp"
#include "watch/watch_event.hpp"

#include <expected>
#include <filesystem>
#include <string>

class ConfigReloader {
public:
    ConfigReloader(std::filesystem::path config_dir,
                   SettingsStore&        settings,
                   AccessControlStore&   access);

    ~ConfigReloader() = default;

    ConfigReloader(const ConfigReloader&)            = delete;
    ConfigReloader& operator=(const ConfigReloader&) = delete;
    ConfigReloader(ConfigReloader&&)                 = delete;
    ConfigReloader& operator=(ConfigReloader&&)      = delete;

    // -----------------------------------------------------------------------
    // reload_all
    //   세 파일을 모두 읽어 한 번에 반영한다. 하나라도 실패하면 아무것도
    //   바꾸지 않고 오류 문자열을 반환한다.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto reload_all() -> std::expected<void, std::string>;

    // 개별 파일 반영. 실패 시 현재 상태 유지 + false.
    bool reload_settings();
    bool reload_banned();
    bool reload_whitelist();

    // PathWatcher 콜백
    void on_watch_event(const WatchEvent& event);
    void on_watch_error(const ChatError& error);

    [[nodiscard]] auto config_dir() const noexcept -> const std::filesystem::path& { return config_dir_; }

private:
    std::filesystem::path config_dir_;
    SettingsStore&        settings_;
    AccessControlStore&   access_;
};
