// ---------------------------------------------------------------------------
// test_config_loader.cpp
//
// ConfigLoader / ConfigReloader 단위 테스트.
//
// [테스트 범위]
// - server.yaml: 기본값, 부분 지정, 범위 밖 값, 타입 오류, 구문 오류
// - banned.yaml / whitelist.yaml: sequence 형식, map+addresses 형식,
//   빈 파일, 파일 없음, 잘못된 형식
// - ConfigReloader: reload_all 원자성, 파일명 기반 라우팅, overflow 전체 재로드
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"
#include "config/config_reloader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Fixture: 테스트별 임시 설정 디렉터리
// ---------------------------------------------------------------------------
class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        dir_ = fs::temp_directory_path() / "chatd_test_config" / unique_name;
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    void write(std::string_view name, std::string_view content) const {
        std::ofstream out(dir_ / name, std::ios::trunc);
        out << content;
    }

    fs::path dir_;
};

// ---------------------------------------------------------------------------
// load_settings
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, Settings_FullFile) {
    write(kSettingsFileName, R"(
server:
  listen_address: "127.0.0.1"
  port: 20000
  io_threads: 2
  shutdown_grace_millis: 500
internal:
  connection_refresh_interval_millis: 250
  retries_on_invalid_packets: 5
access:
  whitelist_enabled: true
)");

    const auto settings = ConfigLoader::load_settings(dir_ / kSettingsFileName);
    ASSERT_TRUE(settings.has_value()) << settings.error();
    EXPECT_EQ(settings->listen_address, "127.0.0.1");
    EXPECT_EQ(settings->port, 20000);
    EXPECT_EQ(settings->io_threads, 2u);
    EXPECT_EQ(settings->shutdown_grace_millis, 500u);
    EXPECT_EQ(settings->internal.connection_refresh_interval_millis, 250);
    EXPECT_EQ(settings->internal.retries_on_invalid_packets, 5);
    EXPECT_TRUE(settings->whitelist_enabled);
}

TEST_F(ConfigLoaderTest, Settings_MissingKeysKeepDefaults) {
    write(kSettingsFileName, "internal:\n  retries_on_invalid_packets: 7\n");

    const auto settings = ConfigLoader::load_settings(dir_ / kSettingsFileName);
    ASSERT_TRUE(settings.has_value()) << settings.error();

    const ServerSettings defaults{};
    EXPECT_EQ(settings->port, defaults.port);
    EXPECT_EQ(settings->listen_address, defaults.listen_address);
    EXPECT_FALSE(settings->whitelist_enabled);
    EXPECT_EQ(settings->internal.connection_refresh_interval_millis,
              kDefaultConnectionRefreshIntervalMillis);
    EXPECT_EQ(settings->internal.retries_on_invalid_packets, 7);
}

// ---------------------------------------------------------------------------
// Settings_RawValuesArePreserved
//   음수 interval / 0 retries 는 로더가 고치지 않는다 (SettingsStore 가 해석).
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, Settings_RawValuesArePreserved) {
    write(kSettingsFileName, R"(
internal:
  connection_refresh_interval_millis: -5
  retries_on_invalid_packets: 0
)");

    const auto settings = ConfigLoader::load_settings(dir_ / kSettingsFileName);
    ASSERT_TRUE(settings.has_value()) << settings.error();
    EXPECT_EQ(settings->internal.connection_refresh_interval_millis, -5);
    EXPECT_EQ(settings->internal.retries_on_invalid_packets, 0);
}

TEST_F(ConfigLoaderTest, Settings_InvalidValuesKeepDefaults) {
    write(kSettingsFileName, R"(
server:
  port: 70000
  io_threads: 0
internal:
  connection_refresh_interval_millis: "soon"
  retries_on_invalid_packets: [1, 2]
)");

    const auto settings = ConfigLoader::load_settings(dir_ / kSettingsFileName);
    ASSERT_TRUE(settings.has_value()) << settings.error();
    EXPECT_EQ(settings->port, ServerSettings{}.port);
    EXPECT_EQ(settings->io_threads, 1u);
    EXPECT_EQ(settings->internal.connection_refresh_interval_millis,
              kDefaultConnectionRefreshIntervalMillis);
    EXPECT_EQ(settings->internal.retries_on_invalid_packets, kDefaultRetriesOnInvalidPackets);
}

TEST_F(ConfigLoaderTest, Settings_Errors) {
    // 파일 없음
    auto settings = ConfigLoader::load_settings(dir_ / kSettingsFileName);
    ASSERT_FALSE(settings.has_value());
    EXPECT_NE(settings.error().find("cannot open"), std::string::npos) << settings.error();

    // 구문 오류 → 라인 번호 포함
    write(kSettingsFileName, "server:\n  port: [1, 2\n");
    settings = ConfigLoader::load_settings(dir_ / kSettingsFileName);
    ASSERT_FALSE(settings.has_value());
    EXPECT_NE(settings.error().find("line"), std::string::npos) << settings.error();

    // 루트가 map 이 아님
    write(kSettingsFileName, "- a\n- b\n");
    settings = ConfigLoader::load_settings(dir_ / kSettingsFileName);
    ASSERT_FALSE(settings.has_value());
}

// ---------------------------------------------------------------------------
// load_address_list
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, AddressList_BothFormats) {
    write(kBannedFileName, "- 10.0.0.7\n- 192.168.0.0/16\n");
    auto list = ConfigLoader::load_address_list(dir_ / kBannedFileName);
    ASSERT_TRUE(list.has_value()) << list.error();
    EXPECT_EQ(*list, (std::vector<std::string>{"10.0.0.7", "192.168.0.0/16"}));

    write(kWhitelistFileName, "addresses:\n  - 127.0.0.1\n  - \"::1\"\n");
    list = ConfigLoader::load_address_list(dir_ / kWhitelistFileName);
    ASSERT_TRUE(list.has_value()) << list.error();
    EXPECT_EQ(*list, (std::vector<std::string>{"127.0.0.1", "::1"}));
}

TEST_F(ConfigLoaderTest, AddressList_EmptyOrMissing) {
    auto list = ConfigLoader::load_address_list(dir_ / kBannedFileName);
    ASSERT_TRUE(list.has_value()) << "missing list file is not an error";
    EXPECT_TRUE(list->empty());

    write(kBannedFileName, "");
    list = ConfigLoader::load_address_list(dir_ / kBannedFileName);
    ASSERT_TRUE(list.has_value());
    EXPECT_TRUE(list->empty());

    write(kBannedFileName, "addresses: []\n");
    list = ConfigLoader::load_address_list(dir_ / kBannedFileName);
    ASSERT_TRUE(list.has_value());
    EXPECT_TRUE(list->empty());
}

TEST_F(ConfigLoaderTest, AddressList_InvalidShape) {
    write(kBannedFileName, "just a string\n");
    EXPECT_FALSE(ConfigLoader::load_address_list(dir_ / kBannedFileName).has_value());

    write(kBannedFileName, "- 10.0.0.1\n- [broken\n");
    EXPECT_FALSE(ConfigLoader::load_address_list(dir_ / kBannedFileName).has_value());
}

// ---------------------------------------------------------------------------
// ConfigReloader
// ---------------------------------------------------------------------------
class ConfigReloaderTest : public ConfigLoaderTest {
protected:
    void write_defaults() const {
        write(kSettingsFileName,
              "internal:\n  retries_on_invalid_packets: 4\naccess:\n  whitelist_enabled: true\n");
        write(kBannedFileName, "- 10.0.0.7\n");
        write(kWhitelistFileName, "- 127.0.0.1\n");
    }

    SettingsStore      settings_;
    AccessControlStore access_;
};

TEST_F(ConfigReloaderTest, ReloadAll_AppliesEverything) {
    write_defaults();
    ConfigReloader reloader{dir_, settings_, access_};

    ASSERT_TRUE(reloader.reload_all().has_value());
    EXPECT_EQ(settings_.retries_on_invalid_packets(), 4);
    EXPECT_TRUE(access_.is_banned("10.0.0.7"));
    EXPECT_TRUE(access_.is_whitelisted("127.0.0.1"));
    EXPECT_FALSE(access_.is_whitelisted("10.0.0.8"));
}

// ---------------------------------------------------------------------------
// ReloadAll_FailureChangesNothing
//   파일 하나라도 깨지면 나머지 파일의 변경도 반영하지 않는다.
// ---------------------------------------------------------------------------
TEST_F(ConfigReloaderTest, ReloadAll_FailureChangesNothing) {
    write_defaults();
    ConfigReloader reloader{dir_, settings_, access_};
    ASSERT_TRUE(reloader.reload_all().has_value());

    write(kSettingsFileName, "internal:\n  retries_on_invalid_packets: 9\n");
    write(kWhitelistFileName, "- [broken\n");

    const auto result = reloader.reload_all();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(settings_.retries_on_invalid_packets(), 4);
    EXPECT_TRUE(access_.snapshot()->whitelist_enabled);
    EXPECT_TRUE(access_.is_whitelisted("127.0.0.1"));
}

TEST_F(ConfigReloaderTest, WatchEvent_RoutesByFileName) {
    write_defaults();
    ConfigReloader reloader{dir_, settings_, access_};
    ASSERT_TRUE(reloader.reload_all().has_value());

    write(kBannedFileName, "- 10.0.0.8\n");
    reloader.on_watch_event(WatchEvent{WatchEventKind::kModified, dir_ / kBannedFileName});
    EXPECT_FALSE(access_.is_banned("10.0.0.7"));
    EXPECT_TRUE(access_.is_banned("10.0.0.8"));

    write(kSettingsFileName, "access:\n  whitelist_enabled: false\n");
    reloader.on_watch_event(WatchEvent{WatchEventKind::kCreated, dir_ / kSettingsFileName});
    EXPECT_TRUE(access_.is_whitelisted("10.9.9.9"));
    EXPECT_EQ(settings_.retries_on_invalid_packets(), kDefaultRetriesOnInvalidPackets);

    // 관련 없는 파일은 무시
    write(kWhitelistFileName, "- 10.9.9.9\n");
    reloader.on_watch_event(WatchEvent{WatchEventKind::kModified, dir_ / "notes.txt"});
    EXPECT_FALSE(access_.snapshot()->whitelist.contains("10.9.9.9"));
}

TEST_F(ConfigReloaderTest, WatchEvent_BrokenFileKeepsCurrentList) {
    write_defaults();
    ConfigReloader reloader{dir_, settings_, access_};
    ASSERT_TRUE(reloader.reload_all().has_value());

    write(kBannedFileName, "- [broken\n");
    reloader.on_watch_event(WatchEvent{WatchEventKind::kModified, dir_ / kBannedFileName});
    EXPECT_TRUE(access_.is_banned("10.0.0.7"));
}

TEST_F(ConfigReloaderTest, WatchEvent_OverflowReloadsEverything) {
    write_defaults();
    ConfigReloader reloader{dir_, settings_, access_};

    reloader.on_watch_event(WatchEvent{WatchEventKind::kOther, dir_});
    EXPECT_EQ(settings_.retries_on_invalid_packets(), 4);
    EXPECT_TRUE(access_.is_banned("10.0.0.7"));
}
