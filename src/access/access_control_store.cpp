#include "access/access_control_store.hpp"

#include <spdlog/spdlog.h>

AccessControlStore::AccessControlStore()
    : current_{std::make_shared<const AccessSnapshot>()}
{}

AccessControlStore::AccessControlStore(AccessSnapshot initial)
    : current_{std::make_shared<const AccessSnapshot>(std::move(initial))}
{}

bool AccessControlStore::is_banned(std::string_view address) const {
    const auto snap = current_.load(std::memory_order_acquire);
    return snap->banned.contains(address);
}

bool AccessControlStore::is_whitelisted(std::string_view address) const {
    const auto snap = current_.load(std::memory_order_acquire);
    if (!snap->whitelist_enabled) {
        return true;
    }
    return snap->whitelist.contains(address);
}

auto AccessControlStore::snapshot() const -> std::shared_ptr<const AccessSnapshot> {
    return current_.load(std::memory_order_acquire);
}

template <typename Mutate>
void AccessControlStore::update(Mutate&& mutate) {
    std::lock_guard lock{writer_mutex_};

    // copy-and-swap: 현재 스냅샷 복사본을 수정한 뒤 통째로 교체
    AccessSnapshot next = *current_.load(std::memory_order_acquire);
    mutate(next);
    current_.store(std::make_shared<const AccessSnapshot>(std::move(next)),
                   std::memory_order_release);
}

void AccessControlStore::reload(AccessSnapshot next) {
    update([&next](AccessSnapshot& snap) { snap = std::move(next); });

    const auto snap = snapshot();
    spdlog::info("[access] reloaded: {} ban rules, {} whitelist rules, whitelist {}",
                 snap->banned.size(), snap->whitelist.size(),
                 snap->whitelist_enabled ? "enabled" : "disabled");
}

void AccessControlStore::replace_banned(AccessList banned) {
    update([&banned](AccessSnapshot& snap) { snap.banned = std::move(banned); });
    spdlog::info("[access] ban list replaced ({} rules)", snapshot()->banned.size());
}

void AccessControlStore::replace_whitelist(AccessList whitelist) {
    update([&whitelist](AccessSnapshot& snap) { snap.whitelist = std::move(whitelist); });
    spdlog::info("[access] whitelist replaced ({} rules)", snapshot()->whitelist.size());
}

void AccessControlStore::set_whitelist_enabled(bool enabled) {
    update([enabled](AccessSnapshot& snap) { snap.whitelist_enabled = enabled; });
}
