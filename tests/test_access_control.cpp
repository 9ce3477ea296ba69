// ---------------------------------------------------------------------------
// test_access_control.cpp
//
// AccessRule / AccessList / AccessControlStore 단위 테스트.
//
// [테스트 범위]
// - 단일 주소, IPv4/IPv6 CIDR 규칙
// - IPv4-mapped IPv6 정규화
// - 해석 불가 규칙/주소 처리
// - whitelist 활성/비활성
// - 스냅샷 교체 원자성 (동시 reload 중 부분 상태 비관찰)
// ---------------------------------------------------------------------------

#include "access/access_control_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// AccessRule
// ---------------------------------------------------------------------------
TEST(AccessRule, ParsesSingleAddressesAndNetworks) {
    EXPECT_TRUE(AccessRule::parse("10.0.0.7").has_value());
    EXPECT_TRUE(AccessRule::parse("  192.168.0.0/16 ").has_value());
    EXPECT_TRUE(AccessRule::parse("::1").has_value());
    EXPECT_TRUE(AccessRule::parse("fd00::/8").has_value());

    EXPECT_FALSE(AccessRule::parse("").has_value());
    EXPECT_FALSE(AccessRule::parse("   ").has_value());
    EXPECT_FALSE(AccessRule::parse("not-an-ip").has_value());
    EXPECT_FALSE(AccessRule::parse("10.0.0.0/40").has_value());
}

TEST(AccessRule, TextKeepsTrimmedOriginal) {
    const auto rule = AccessRule::parse("  10.0.0.0/8\t");
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->text(), "10.0.0.0/8");
}

// ---------------------------------------------------------------------------
// AccessList
// ---------------------------------------------------------------------------
TEST(AccessList, MatchesExactAndCidr) {
    const auto list = AccessList::from_strings({"10.0.0.7", "192.168.0.0/16", "fd00::/8"});
    ASSERT_EQ(list.size(), 3u);

    EXPECT_TRUE(list.contains("10.0.0.7"));
    EXPECT_FALSE(list.contains("10.0.0.8"));
    EXPECT_TRUE(list.contains("192.168.44.1"));
    EXPECT_FALSE(list.contains("192.169.0.1"));
    EXPECT_TRUE(list.contains("fd12:3456::1"));
    EXPECT_FALSE(list.contains("fe80::1"));
}

// ---------------------------------------------------------------------------
// MappedAddressesCompareAsIpv4
//   ::ffff:10.0.0.7 로 들어온 연결도 "10.0.0.7" 규칙에 매칭되어야 한다.
// ---------------------------------------------------------------------------
TEST(AccessList, MappedAddressesCompareAsIpv4) {
    const auto list = AccessList::from_strings({"10.0.0.7", "172.16.0.0/12"});
    EXPECT_TRUE(list.contains("::ffff:10.0.0.7"));
    EXPECT_TRUE(list.contains("::ffff:172.20.1.1"));

    const auto mapped_rule = AccessList::from_strings({"::ffff:10.0.0.9"});
    EXPECT_TRUE(mapped_rule.contains("10.0.0.9"));
}

TEST(AccessList, InvalidEntriesAreSkipped) {
    const auto list = AccessList::from_strings({"bogus", "10.0.0.1", "", "1.2.3.4/99"});
    EXPECT_EQ(list.size(), 1u);
    EXPECT_TRUE(list.contains("10.0.0.1"));
}

TEST(AccessList, UnparseableAddressNeverMatches) {
    const auto list = AccessList::from_strings({"0.0.0.0/0"});
    EXPECT_TRUE(list.contains("8.8.8.8"));
    EXPECT_FALSE(list.contains("unknown"));
    EXPECT_FALSE(list.contains(""));
}

// ---------------------------------------------------------------------------
// AccessControlStore
// ---------------------------------------------------------------------------
TEST(AccessControlStore, DefaultAllowsEveryone) {
    AccessControlStore store;
    EXPECT_FALSE(store.is_banned("10.0.0.7"));
    EXPECT_TRUE(store.is_whitelisted("10.0.0.7"));
    EXPECT_TRUE(store.is_whitelisted("unknown")) << "whitelist disabled allows any address";
}

TEST(AccessControlStore, WhitelistEnabled) {
    AccessControlStore store{AccessSnapshot{
        .banned            = AccessList{},
        .whitelist         = AccessList::from_strings({"127.0.0.1", "::1"}),
        .whitelist_enabled = true,
    }};

    EXPECT_TRUE(store.is_whitelisted("127.0.0.1"));
    EXPECT_TRUE(store.is_whitelisted("::1"));
    EXPECT_FALSE(store.is_whitelisted("10.0.0.7"));
    EXPECT_FALSE(store.is_whitelisted("unknown"));

    store.set_whitelist_enabled(false);
    EXPECT_TRUE(store.is_whitelisted("10.0.0.7"));
    // 목록 자체는 유지된다
    EXPECT_EQ(store.snapshot()->whitelist.size(), 2u);
}

TEST(AccessControlStore, PartialReplaceKeepsOtherFields) {
    AccessControlStore store{AccessSnapshot{
        .banned            = AccessList::from_strings({"10.0.0.7"}),
        .whitelist         = AccessList::from_strings({"10.0.0.0/8"}),
        .whitelist_enabled = true,
    }};

    store.replace_banned(AccessList::from_strings({"10.0.0.8"}));
    EXPECT_FALSE(store.is_banned("10.0.0.7"));
    EXPECT_TRUE(store.is_banned("10.0.0.8"));
    EXPECT_TRUE(store.snapshot()->whitelist_enabled);
    EXPECT_TRUE(store.is_whitelisted("10.1.2.3"));

    store.replace_whitelist(AccessList::from_strings({"192.168.0.0/16"}));
    EXPECT_FALSE(store.is_whitelisted("10.1.2.3"));
    EXPECT_TRUE(store.is_banned("10.0.0.8"));
}

// ---------------------------------------------------------------------------
// BannedAddressMayAlsoBeWhitelisted
//   두 목록은 독립적이다. 우선순위 판단은 연결 핸들러가 한다.
// ---------------------------------------------------------------------------
TEST(AccessControlStore, BannedAddressMayAlsoBeWhitelisted) {
    AccessControlStore store{AccessSnapshot{
        .banned            = AccessList::from_strings({"10.0.0.7"}),
        .whitelist         = AccessList::from_strings({"10.0.0.7"}),
        .whitelist_enabled = true,
    }};
    EXPECT_TRUE(store.is_banned("10.0.0.7"));
    EXPECT_TRUE(store.is_whitelisted("10.0.0.7"));
}

// ---------------------------------------------------------------------------
// ConcurrentReload_SnapshotIsNeverTorn
//   두 스냅샷을 번갈아 reload 하는 동안 reader 가 보는 스냅샷은
//   항상 둘 중 하나와 정확히 일치해야 한다.
//     A: banned={10.0.0.1}, whitelist={10.0.0.1}
//     B: banned={},         whitelist={}
//   banned 와 whitelist 의 포함 여부가 어긋나면 부분 갱신을 관찰한 것이다.
// ---------------------------------------------------------------------------
TEST(AccessControlStore, ConcurrentReload_SnapshotIsNeverTorn) {
    AccessControlStore store;

    std::atomic<bool> done{false};
    std::atomic<int>  torn{0};

    std::thread writer([&] {
        for (int i = 0; i < 2000; ++i) {
            if (i % 2 == 0) {
                store.reload(AccessSnapshot{
                    .banned            = AccessList::from_strings({"10.0.0.1"}),
                    .whitelist         = AccessList::from_strings({"10.0.0.1"}),
                    .whitelist_enabled = true,
                });
            } else {
                store.reload(AccessSnapshot{
                    .banned            = AccessList{},
                    .whitelist         = AccessList{},
                    .whitelist_enabled = true,
                });
            }
        }
        done.store(true);
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!done.load()) {
                const auto snap = store.snapshot();
                const bool banned      = snap->banned.contains("10.0.0.1");
                const bool whitelisted = snap->whitelist.contains("10.0.0.1");
                if (banned != whitelisted) {
                    torn.fetch_add(1);
                }
            }
        });
    }

    writer.join();
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(torn.load(), 0) << "observed a partially replaced snapshot";
}
