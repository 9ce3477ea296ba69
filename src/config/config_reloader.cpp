#include "config/config_reloader.hpp"

#include "config/config_loader.hpp"

#include <spdlog/spdlog.h>

ConfigReloader::ConfigReloader(std::filesystem::path config_dir,
                               SettingsStore&        settings,
                               AccessControlStore&   access)
    : config_dir_{std::move(config_dir)}
    , settings_{settings}
    , access_{access}
{}

// ---------------------------------------------------------------------------
// reload_all
//   1. 세 파일 모두 로드 (실패 시 즉시 반환, 상태 변경 없음)
//   2. AccessSnapshot 을 통째로 교체 → ban/whitelist/활성 여부가 함께 바뀐다
//   3. SettingsStore 교체
// ---------------------------------------------------------------------------
auto ConfigReloader::reload_all() -> std::expected<void, std::string> {
    auto settings = ConfigLoader::load_settings(config_dir_ / kSettingsFileName);
    if (!settings) {
        return std::unexpected(settings.error());
    }

    auto banned = ConfigLoader::load_address_list(config_dir_ / kBannedFileName);
    if (!banned) {
        return std::unexpected(banned.error());
    }

    auto whitelist = ConfigLoader::load_address_list(config_dir_ / kWhitelistFileName);
    if (!whitelist) {
        return std::unexpected(whitelist.error());
    }

    access_.reload(AccessSnapshot{
        .banned            = AccessList::from_strings(*banned),
        .whitelist         = AccessList::from_strings(*whitelist),
        .whitelist_enabled = settings->whitelist_enabled,
    });
    settings_.reload(std::move(*settings));

    return {};
}

bool ConfigReloader::reload_settings() {
    auto settings = ConfigLoader::load_settings(config_dir_ / kSettingsFileName);
    if (!settings) {
        spdlog::warn("[config] settings reload failed (keeping current settings): {}",
                     settings.error());
        return false;
    }

    access_.set_whitelist_enabled(settings->whitelist_enabled);
    settings_.reload(std::move(*settings));
    return true;
}

bool ConfigReloader::reload_banned() {
    auto entries = ConfigLoader::load_address_list(config_dir_ / kBannedFileName);
    if (!entries) {
        spdlog::warn("[config] ban list reload failed (keeping current list): {}",
                     entries.error());
        return false;
    }

    access_.replace_banned(AccessList::from_strings(*entries));
    return true;
}

bool ConfigReloader::reload_whitelist() {
    auto entries = ConfigLoader::load_address_list(config_dir_ / kWhitelistFileName);
    if (!entries) {
        spdlog::warn("[config] whitelist reload failed (keeping current list): {}",
                     entries.error());
        return false;
    }

    access_.replace_whitelist(AccessList::from_strings(*entries));
    return true;
}

// ---------------------------------------------------------------------------
// on_watch_event: 파일명으로 대상 저장소를 고른다.
//   kOther 중 디렉터리 자체(queue overflow) 는 전체 재로드.
// ---------------------------------------------------------------------------
void ConfigReloader::on_watch_event(const WatchEvent& event) {
    if (event.kind == WatchEventKind::kOther && event.path == config_dir_) {
        spdlog::info("[config] event queue overflow, reloading everything");
        if (auto result = reload_all(); !result) {
            spdlog::warn("[config] full reload failed (keeping current state): {}",
                         result.error());
        }
        return;
    }

    const std::string name = event.path.filename().string();

    if (name == kSettingsFileName) {
        spdlog::info("[config] {} changed, reloading settings", name);
        reload_settings();
    } else if (name == kBannedFileName) {
        spdlog::info("[config] {} changed, reloading ban list", name);
        reload_banned();
    } else if (name == kWhitelistFileName) {
        spdlog::info("[config] {} changed, reloading whitelist", name);
        reload_whitelist();
    } else {
        spdlog::debug("[config] ignoring change to '{}'", event.path.string());
    }
}

void ConfigReloader::on_watch_error(const ChatError& error) {
    spdlog::error("[config] watcher error on '{}': {} ({})",
                  config_dir_.string(), error.message, error.context);
}
