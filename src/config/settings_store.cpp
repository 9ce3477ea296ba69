#include "config/settings_store.hpp"

#include <spdlog/spdlog.h>

auto resolve_refresh_interval(std::int64_t raw_millis) noexcept
    -> std::chrono::milliseconds {
    if (raw_millis < 0) {
        return std::chrono::milliseconds{kDefaultConnectionRefreshIntervalMillis};
    }
    return std::chrono::milliseconds{raw_millis};
}

auto resolve_retry_limit(std::int32_t raw) noexcept -> std::int32_t {
    return raw <= 0 ? kDefaultRetriesOnInvalidPackets : raw;
}

SettingsStore::SettingsStore()
    : current_{std::make_shared<const ServerSettings>()}
{}

SettingsStore::SettingsStore(ServerSettings initial)
    : current_{std::make_shared<const ServerSettings>(std::move(initial))}
{}

auto SettingsStore::current() const -> std::shared_ptr<const ServerSettings> {
    return current_.load(std::memory_order_acquire);
}

void SettingsStore::reload(ServerSettings next) {
    const auto refresh = resolve_refresh_interval(
        next.internal.connection_refresh_interval_millis);
    const auto retries = resolve_retry_limit(next.internal.retries_on_invalid_packets);

    current_.store(std::make_shared<const ServerSettings>(std::move(next)),
                   std::memory_order_release);

    spdlog::info("[settings] reloaded: refresh_interval={}ms, retries_on_invalid_packets={}",
                 refresh.count(), retries);
}

auto SettingsStore::connection_refresh_interval() const -> std::chrono::milliseconds {
    const auto snap = current();
    return resolve_refresh_interval(snap->internal.connection_refresh_interval_millis);
}

auto SettingsStore::retries_on_invalid_packets() const -> std::int32_t {
    const auto snap = current();
    return resolve_retry_limit(snap->internal.retries_on_invalid_packets);
}
