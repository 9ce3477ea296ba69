#pragma once

// ---------------------------------------------------------------------------
// access_list.hpp
//
// IP 주소 기반 접근 제어 규칙 목록 (ban list / whitelist 공용).
//
// [규칙 형식]
// - 단일 주소: "10.0.0.7", "::1"
// - CIDR 네트워크: "192.168.0.0/16", "fd00::/8"
// - IPv4-mapped IPv6 (::ffff:a.b.c.d) 는 IPv4 주소로 정규화하여 비교한다.
//
// [불변성]
// AccessList 는 생성 후 변경하지 않는다. 갱신은 AccessControlStore 가
// 새 AccessList 로 통째로 교체하는 방식으로만 이루어진다.
// ---------------------------------------------------------------------------

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <boost/asio/ip/network_v6.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// AccessRule
//   주소 하나 또는 네트워크 하나에 매칭되는 규칙.
// ---------------------------------------------------------------------------
class AccessRule {
public:
    // parse
    //   "10.0.0.7" / "10.0.0.0/8" / "::1" / "fd00::/8" 형식을 해석한다.
    //   실패 시: std::unexpected(error_message)
    [[nodiscard]] static auto parse(std::string_view text)
        -> std::expected<AccessRule, std::string>;

    [[nodiscard]] bool matches(const boost::asio::ip::address& address) const noexcept;

    // 원문 표기 (로그용)
    [[nodiscard]] auto text() const noexcept -> const std::string& { return text_; }

private:
    using Matcher = std::variant<boost::asio::ip::address,
                                 boost::asio::ip::network_v4,
                                 boost::asio::ip::network_v6>;

    AccessRule(std::string text, Matcher matcher);

    std::string text_;
    Matcher     matcher_;
};

// ---------------------------------------------------------------------------
// AccessList
//   AccessRule 의 불변 집합.
// ---------------------------------------------------------------------------
class AccessList {
public:
    AccessList() = default;
    explicit AccessList(std::vector<AccessRule> rules);

    // -----------------------------------------------------------------------
    // from_strings
    //   문자열 목록으로 AccessList 를 만든다.
    //   해석할 수 없는 항목은 경고 로그를 남기고 건너뛴다 (매칭되지 않음).
    // -----------------------------------------------------------------------
    [[nodiscard]] static auto from_strings(const std::vector<std::string>& entries)
        -> AccessList;

    // contains: 주소 문자열이 어느 규칙에든 매칭되면 true.
    //           주소를 해석할 수 없으면 false.
    [[nodiscard]] bool contains(std::string_view address) const;
    [[nodiscard]] bool contains(const boost::asio::ip::address& address) const noexcept;

    [[nodiscard]] auto size()  const noexcept -> std::size_t { return rules_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }
    [[nodiscard]] auto rules() const noexcept -> const std::vector<AccessRule>& { return rules_; }

private:
    std::vector<AccessRule> rules_{};
};

// ---------------------------------------------------------------------------
// parse_remote_address
//   연결 원격 주소 문자열을 정규화된 ip::address 로 변환한다.
//   IPv4-mapped IPv6 는 IPv4 로 변환. 해석 실패 시 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] auto parse_remote_address(std::string_view address)
    -> std::optional<boost::asio::ip::address>;
