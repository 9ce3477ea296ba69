// ---------------------------------------------------------------------------
// config_loader.cpp
//
// server.yaml / banned.yaml / whitelist.yaml 을 yaml-cpp 로 읽는다.
//
// [설계 원칙]
// - All-or-nothing: 문서 단위 파싱 실패 시 부분 결과를 반환하지 않는다.
// - 개별 스칼라 값의 타입이 맞지 않으면 해당 키만 기본값을 유지하고 경고한다.
// - 값의 의미 검증(음수 refresh interval 등)은 여기서 하지 않는다.
//   원문 값을 그대로 보관하고 SettingsStore 접근자가 기본값 대체를 수행한다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <cstdint>
#include <system_error>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 값을 T 로 읽는다. 없거나 타입이 다르면 fallback.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] T read_scalar(const YAML::Node& node, std::string_view key, T fallback) {
    if (!node) {
        return fallback;
    }
    if (!node.IsScalar()) {
        spdlog::warn("[config] '{}' is not a scalar, keeping default", key);
        return fallback;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        spdlog::warn("[config] '{}' has invalid value '{}', keeping default: {}",
                     key, node.Scalar(), e.what());
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        } else {
            spdlog::warn("[config] ignoring non-scalar address entry");
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 파일 로드 (yaml-cpp 예외 → 오류 문자열)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<YAML::Node, std::string>
load_yaml(const std::filesystem::path& path) {
    try {
        return YAML::LoadFile(path.string());
    } catch (const YAML::BadFile& e) {
        return std::unexpected(fmt::format(
            "cannot open file '{}': {}", path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        // 라인 번호 포함 (yaml-cpp 는 0-based)
        return std::unexpected(fmt::format(
            "YAML parse error in '{}' at line {}, col {}: {}",
            path.string(), e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "YAML error in '{}': {}", path.string(), e.what()));
    }
}

void parse_server_section(const YAML::Node& node, ServerSettings& settings) {
    if (!node || !node.IsMap()) {
        return;
    }

    settings.listen_address = read_scalar<std::string>(
        node["listen_address"], "server.listen_address", settings.listen_address);

    const auto port = read_scalar<std::uint32_t>(node["port"], "server.port", settings.port);
    if (port == 0 || port > 65535) {
        spdlog::warn("[config] server.port {} out of range, keeping {}", port, settings.port);
    } else {
        settings.port = static_cast<std::uint16_t>(port);
    }

    settings.io_threads = read_scalar<std::uint32_t>(
        node["io_threads"], "server.io_threads", settings.io_threads);
    if (settings.io_threads == 0) {
        spdlog::warn("[config] server.io_threads must be positive, using 1");
        settings.io_threads = 1;
    }

    settings.shutdown_grace_millis = read_scalar<std::uint32_t>(
        node["shutdown_grace_millis"], "server.shutdown_grace_millis",
        settings.shutdown_grace_millis);
}

void parse_internal_section(const YAML::Node& node, InternalSettings& internal) {
    if (!node || !node.IsMap()) {
        return;
    }

    internal.connection_refresh_interval_millis = read_scalar<std::int64_t>(
        node["connection_refresh_interval_millis"],
        "internal.connection_refresh_interval_millis",
        internal.connection_refresh_interval_millis);

    internal.retries_on_invalid_packets = read_scalar<std::int32_t>(
        node["retries_on_invalid_packets"],
        "internal.retries_on_invalid_packets",
        internal.retries_on_invalid_packets);
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load_settings
// ---------------------------------------------------------------------------
std::expected<ServerSettings, std::string>
ConfigLoader::load_settings(const std::filesystem::path& path) {
    auto root = load_yaml(path);
    if (!root) {
        spdlog::error("[config] {}", root.error());
        return std::unexpected(root.error());
    }

    if (!root->IsMap()) {
        const std::string err = fmt::format(
            "'{}' is not a valid YAML map (top-level)", path.string());
        spdlog::error("[config] {}", err);
        return std::unexpected(err);
    }

    ServerSettings settings{};

    try {
        parse_server_section((*root)["server"], settings);
        parse_internal_section((*root)["internal"], settings.internal);

        const YAML::Node access = (*root)["access"];
        if (access && access.IsMap()) {
            settings.whitelist_enabled = read_scalar<bool>(
                access["whitelist_enabled"], "access.whitelist_enabled",
                settings.whitelist_enabled);
        }
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "error parsing '{}': {}", path.string(), e.what());
        spdlog::error("[config] {}", err);
        return std::unexpected(err);
    }

    spdlog::info("[config] settings loaded from '{}': refresh_interval={}ms, retries={}, "
                 "whitelist={}",
                 path.string(),
                 settings.internal.connection_refresh_interval_millis,
                 settings.internal.retries_on_invalid_packets,
                 settings.whitelist_enabled);

    return settings;
}

// ---------------------------------------------------------------------------
// ConfigLoader::load_address_list
// ---------------------------------------------------------------------------
std::expected<std::vector<std::string>, std::string>
ConfigLoader::load_address_list(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("[config] '{}' not found, using empty list", path.string());
        return std::vector<std::string>{};
    }

    auto root = load_yaml(path);
    if (!root) {
        spdlog::error("[config] {}", root.error());
        return std::unexpected(root.error());
    }

    // 빈 파일
    if (root->IsNull()) {
        return std::vector<std::string>{};
    }

    try {
        if (root->IsSequence()) {
            return read_string_sequence(*root);
        }
        if (root->IsMap()) {
            return read_string_sequence((*root)["addresses"]);
        }
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "error parsing '{}': {}", path.string(), e.what());
        spdlog::error("[config] {}", err);
        return std::unexpected(err);
    }

    const std::string err = fmt::format(
        "'{}' must be a sequence of addresses or a map with 'addresses'", path.string());
    spdlog::error("[config] {}", err);
    return std::unexpected(err);
}
