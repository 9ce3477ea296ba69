#pragma once

// ---------------------------------------------------------------------------
// access_control_store.hpp
//
// ban list / whitelist 의 현재 상태를 보관하고 원격 주소 단위로 조회한다.
//
// [Hot Reload]
// 상태는 불변 AccessSnapshot 하나로 묶여 있고,
// std::atomic<std::shared_ptr<const AccessSnapshot>> 교체로만 갱신된다.
// - 조회: load() 로 로컬 shared_ptr 을 취득 → 한 조회 안에서는 항상 한 스냅샷만 본다.
// - 갱신: 새 스냅샷을 완성한 뒤 store() → 부분 갱신 상태는 관찰되지 않는다.
// - 목록 하나만 바꾸는 갱신(replace_banned 등)은 read-modify-write 이므로
//   writer 끼리는 writer_mutex_ 로 직렬화한다. reader 는 락을 잡지 않는다.
// ---------------------------------------------------------------------------

#include "access/access_list.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>

// ---------------------------------------------------------------------------
// AccessSnapshot
//   whitelist_enabled = false 이면 whitelist 내용과 무관하게 모두 허용.
// ---------------------------------------------------------------------------
struct AccessSnapshot {
    AccessList banned{};
    AccessList whitelist{};
    bool       whitelist_enabled{false};
};

// ---------------------------------------------------------------------------
// AccessControlStore
//
//   [스레드 안전성]
//   - is_banned / is_whitelisted / snapshot: 모든 연결 스레드에서 동시 호출 안전.
//   - reload / replace_* / set_whitelist_enabled: 감시 스레드에서 호출.
// ---------------------------------------------------------------------------
class AccessControlStore {
public:
    AccessControlStore();
    explicit AccessControlStore(AccessSnapshot initial);

    ~AccessControlStore() = default;

    AccessControlStore(const AccessControlStore&)            = delete;
    AccessControlStore& operator=(const AccessControlStore&) = delete;
    AccessControlStore(AccessControlStore&&)                 = delete;
    AccessControlStore& operator=(AccessControlStore&&)      = delete;

    [[nodiscard]] bool is_banned(std::string_view address) const;

    // whitelist 비활성 시 항상 true. 활성 시 해석 불가 주소는 false.
    [[nodiscard]] bool is_whitelisted(std::string_view address) const;

    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const AccessSnapshot>;

    // 전체 교체
    void reload(AccessSnapshot next);

    // 부분 교체 (나머지 필드는 현재 스냅샷에서 복사)
    void replace_banned(AccessList banned);
    void replace_whitelist(AccessList whitelist);
    void set_whitelist_enabled(bool enabled);

private:
    template <typename Mutate>
    void update(Mutate&& mutate);

    std::atomic<std::shared_ptr<const AccessSnapshot>> current_;
    std::mutex                                         writer_mutex_;
};
