// ---------------------------------------------------------------------------
// access_list.cpp
//
// [알려진 한계]
// - 호스트명 규칙은 지원하지 않는다 (DNS 조회 없음).
// - 규칙 수가 많아지면 선형 탐색 비용이 커진다. ban list 는 수백 개 수준을
//   가정한다.
// ---------------------------------------------------------------------------

#include "access/access_list.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace ip = boost::asio::ip;

namespace {

// IPv4-mapped IPv6 → IPv4 정규화
ip::address normalize(const ip::address& address) {
    if (address.is_v6() && address.to_v6().is_v4_mapped()) {
        return ip::make_address_v4(ip::v4_mapped, address.to_v6());
    }
    return address;
}

bool in_network_v4(const ip::address_v4& address, const ip::network_v4& net) noexcept {
    const auto mask = net.netmask().to_uint();
    return (address.to_uint() & mask) == (net.network().to_uint() & mask);
}

bool in_network_v6(const ip::address_v6& address, const ip::network_v6& net) noexcept {
    const auto addr_bytes = address.to_bytes();
    const auto net_bytes  = net.network().to_bytes();

    unsigned remaining = net.prefix_length();
    for (std::size_t i = 0; i < addr_bytes.size() && remaining > 0; ++i) {
        const unsigned bits = remaining >= 8 ? 8U : remaining;
        const auto mask = static_cast<unsigned char>(0xFFU << (8U - bits));
        if ((addr_bytes[i] & mask) != (net_bytes[i] & mask)) {
            return false;
        }
        remaining -= bits;
    }
    return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// parse_remote_address
// ---------------------------------------------------------------------------
auto parse_remote_address(std::string_view address) -> std::optional<ip::address> {
    boost::system::error_code ec;
    const auto parsed = ip::make_address(std::string{address}, ec);
    if (ec) {
        return std::nullopt;
    }
    return normalize(parsed);
}

// ---------------------------------------------------------------------------
// AccessRule
// ---------------------------------------------------------------------------
AccessRule::AccessRule(std::string text, Matcher matcher)
    : text_{std::move(text)}
    , matcher_{std::move(matcher)}
{}

auto AccessRule::parse(std::string_view text) -> std::expected<AccessRule, std::string> {
    std::string trimmed{text};
    const auto first = trimmed.find_first_not_of(" \t");
    const auto last  = trimmed.find_last_not_of(" \t");
    if (first == std::string::npos) {
        return std::unexpected(std::string{"empty rule"});
    }
    trimmed = trimmed.substr(first, last - first + 1);

    boost::system::error_code ec;

    if (trimmed.find('/') == std::string::npos) {
        const auto address = ip::make_address(trimmed, ec);
        if (ec) {
            return std::unexpected("invalid address '" + trimmed + "': " + ec.message());
        }
        return AccessRule{trimmed, normalize(address)};
    }

    if (trimmed.find(':') == std::string::npos) {
        const auto net = ip::make_network_v4(trimmed, ec);
        if (ec) {
            return std::unexpected("invalid IPv4 network '" + trimmed + "': " + ec.message());
        }
        return AccessRule{trimmed, net};
    }

    const auto net = ip::make_network_v6(trimmed, ec);
    if (ec) {
        return std::unexpected("invalid IPv6 network '" + trimmed + "': " + ec.message());
    }
    return AccessRule{trimmed, net};
}

bool AccessRule::matches(const ip::address& address) const noexcept {
    if (const auto* exact = std::get_if<ip::address>(&matcher_)) {
        return *exact == address;
    }
    if (const auto* net4 = std::get_if<ip::network_v4>(&matcher_)) {
        return address.is_v4() && in_network_v4(address.to_v4(), *net4);
    }
    if (const auto* net6 = std::get_if<ip::network_v6>(&matcher_)) {
        return address.is_v6() && in_network_v6(address.to_v6(), *net6);
    }
    return false;
}

// ---------------------------------------------------------------------------
// AccessList
// ---------------------------------------------------------------------------
AccessList::AccessList(std::vector<AccessRule> rules)
    : rules_{std::move(rules)}
{}

auto AccessList::from_strings(const std::vector<std::string>& entries) -> AccessList {
    std::vector<AccessRule> rules;
    rules.reserve(entries.size());

    for (const auto& entry : entries) {
        auto rule = AccessRule::parse(entry);
        if (!rule) {
            spdlog::warn("[access] skipping rule: {}", rule.error());
            continue;
        }
        rules.push_back(std::move(*rule));
    }
    return AccessList{std::move(rules)};
}

bool AccessList::contains(std::string_view address) const {
    const auto parsed = parse_remote_address(address);
    if (!parsed) {
        return false;
    }
    return contains(*parsed);
}

bool AccessList::contains(const ip::address& address) const noexcept {
    const auto normalized = normalize(address);
    for (const auto& rule : rules_) {
        if (rule.matches(normalized)) {
            return true;
        }
    }
    return false;
}
