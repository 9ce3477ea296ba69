#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// 설정 디렉터리의 YAML 파일을 읽는다.
//
//   <config_dir>/server.yaml     → ServerSettings
//   <config_dir>/banned.yaml     → ban list 주소 문자열 목록
//   <config_dir>/whitelist.yaml  → whitelist 주소 문자열 목록
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 결과를 반환하지 않는다.
//   호출자는 실패 시 기존 상태를 유지한다.
// - 주소 목록 파일이 없으면 빈 목록으로 간주한다 (오류 아님).
//   server.yaml 이 없으면 오류다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include "config/settings.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view kSettingsFileName  = "server.yaml";
inline constexpr std::string_view kBannedFileName    = "banned.yaml";
inline constexpr std::string_view kWhitelistFileName = "whitelist.yaml";

class ConfigLoader {
public:
    // load_settings
    //   server.yaml 을 ServerSettings 로 파싱한다.
    //   실패: 파일 없음, YAML 구문 오류, 루트가 map 이 아님
    //   개별 값 타입 오류는 경고 후 기본값 유지
    [[nodiscard]] static std::expected<ServerSettings, std::string>
    load_settings(const std::filesystem::path& path);

    // load_address_list
    //   두 형식을 허용한다.
    //     - 최상위 sequence:  ["10.0.0.1", "192.168.0.0/16"]
    //     - map + addresses:  { addresses: [...] }
    //   빈 파일/파일 없음 → 빈 목록
    [[nodiscard]] static std::expected<std::vector<std::string>, std::string>
    load_address_list(const std::filesystem::path& path);
};
