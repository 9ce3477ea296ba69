#include "protocol/packet.hpp"

#include "common/json_escape.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <unordered_map>
#include <utility>

// ---------------------------------------------------------------------------
// Packet 구현
//
// 레코드는 flat JSON object 이다. 값은 string / true / false / null / number
// 만 허용하며, 중첩 object/array 는 malformed 로 처리한다.
// number 는 알 수 없는 필드에서만 허용된다 (필드 스키마에 number 타입 없음).
// ---------------------------------------------------------------------------

namespace {

constexpr std::string_view kTypeField = "packet_type";

struct NameEntry {
    PacketType       type;
    std::string_view name;
};

constexpr std::array<NameEntry, 5> kPacketNames{{
    {PacketType::kBanned,           "BANNED"},
    {PacketType::kNotWhitelisted,   "NOT_WHITELISTED"},
    {PacketType::kConnectionClosed, "CONNECTION_CLOSED"},
    {PacketType::kUsername,         "USERNAME"},
    {PacketType::kClientMessage,    "CLIENT_MESSAGE"},
}};

// ---------------------------------------------------------------------------
// FieldValue / FieldMap
//   flat object 의 값 하나. number 는 원문 그대로 보관한다.
// ---------------------------------------------------------------------------
struct FieldValue {
    enum class Kind : std::uint8_t { kString, kBool, kNull, kNumber };

    Kind        kind{Kind::kNull};
    std::string text{};
    bool        flag{false};
};

using FieldMap = std::unordered_map<std::string, FieldValue>;

auto malformed(std::string message, std::string_view record, std::size_t pos)
    -> std::unexpected<ParseError>
{
    return std::unexpected(ParseError{
        ParseErrorCode::kMalformedRecord,
        std::move(message),
        fmt::format("offset {} of {}", pos, record.size())
    });
}

// UTF-8 인코딩 (코드 포인트 → 바이트열)
void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ---------------------------------------------------------------------------
// FlatObjectReader
//   레코드 텍스트 하나를 FieldMap 으로 읽는다.
// ---------------------------------------------------------------------------
class FlatObjectReader {
public:
    explicit FlatObjectReader(std::string_view text) : text_{text} {}

    auto read() -> std::expected<FieldMap, ParseError> {
        FieldMap fields;

        skip_ws();
        if (!consume('{')) {
            return malformed("record must start with '{'", text_, pos_);
        }

        skip_ws();
        if (consume('}')) {
            return finish(std::move(fields));
        }

        while (true) {
            skip_ws();
            auto key = read_string();
            if (!key) {
                return std::unexpected(key.error());
            }

            skip_ws();
            if (!consume(':')) {
                return malformed("expected ':' after key", text_, pos_);
            }

            skip_ws();
            auto value = read_value();
            if (!value) {
                return std::unexpected(value.error());
            }
            fields.insert_or_assign(std::move(*key), std::move(*value));

            skip_ws();
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                break;
            }
            return malformed("expected ',' or '}'", text_, pos_);
        }

        return finish(std::move(fields));
    }

private:
    auto finish(FieldMap fields) -> std::expected<FieldMap, ParseError> {
        skip_ws();
        if (pos_ != text_.size()) {
            return malformed("trailing characters after record", text_, pos_);
        }
        return fields;
    }

    void skip_ws() noexcept {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\r' || text_[pos_] == '\n')) {
            ++pos_;
        }
    }

    bool consume(char expected) noexcept {
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_literal(std::string_view literal) noexcept {
        if (text_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    auto read_hex4() -> std::expected<std::uint32_t, ParseError> {
        if (pos_ + 4 > text_.size()) {
            return malformed("truncated \\u escape", text_, pos_);
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = text_[pos_++];
            value <<= 4U;
            if (c >= '0' && c <= '9') {
                value |= static_cast<std::uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                value |= static_cast<std::uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                value |= static_cast<std::uint32_t>(c - 'A' + 10);
            } else {
                return malformed("invalid hex digit in \\u escape", text_, pos_);
            }
        }
        return value;
    }

    auto read_string() -> std::expected<std::string, ParseError> {
        if (!consume('"')) {
            return malformed("expected string", text_, pos_);
        }

        std::string out;
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return malformed("control character in string", text_, pos_);
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                break;
            }
            const char esc = text_[pos_++];
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    auto cp = read_hex4();
                    if (!cp) {
                        return std::unexpected(cp.error());
                    }
                    std::uint32_t code = *cp;
                    // surrogate pair
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (!consume_literal("\\u")) {
                            return malformed("unpaired high surrogate", text_, pos_);
                        }
                        auto low = read_hex4();
                        if (!low) {
                            return std::unexpected(low.error());
                        }
                        if (*low < 0xDC00 || *low > 0xDFFF) {
                            return malformed("invalid low surrogate", text_, pos_);
                        }
                        code = 0x10000 + ((code - 0xD800) << 10U) + (*low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        return malformed("unpaired low surrogate", text_, pos_);
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return malformed(fmt::format("invalid escape '\\{}'", esc), text_, pos_);
            }
        }
        return malformed("unterminated string", text_, pos_);
    }

    auto read_number() -> std::expected<FieldValue, ParseError> {
        const std::size_t start = pos_;
        consume('-');
        auto digits = [this]() {
            std::size_t n = 0;
            while (pos_ < text_.size() &&
                   std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
                ++pos_;
                ++n;
            }
            return n;
        };
        if (digits() == 0) {
            return malformed("invalid number", text_, pos_);
        }
        if (consume('.') && digits() == 0) {
            return malformed("invalid number fraction", text_, pos_);
        }
        if (consume('e') || consume('E')) {
            if (!consume('+')) {
                consume('-');
            }
            if (digits() == 0) {
                return malformed("invalid number exponent", text_, pos_);
            }
        }
        return FieldValue{FieldValue::Kind::kNumber,
                          std::string{text_.substr(start, pos_ - start)}, false};
    }

    auto read_value() -> std::expected<FieldValue, ParseError> {
        if (pos_ >= text_.size()) {
            return malformed("missing value", text_, pos_);
        }
        const char c = text_[pos_];
        if (c == '"') {
            auto str = read_string();
            if (!str) {
                return std::unexpected(str.error());
            }
            return FieldValue{FieldValue::Kind::kString, std::move(*str), false};
        }
        if (consume_literal("true")) {
            return FieldValue{FieldValue::Kind::kBool, {}, true};
        }
        if (consume_literal("false")) {
            return FieldValue{FieldValue::Kind::kBool, {}, false};
        }
        if (consume_literal("null")) {
            return FieldValue{FieldValue::Kind::kNull, {}, false};
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
            return read_number();
        }
        if (c == '{' || c == '[') {
            return malformed("nested values are not supported", text_, pos_);
        }
        return malformed(fmt::format("unexpected character '{}'", c), text_, pos_);
    }

    std::string_view text_;
    std::size_t      pos_{0};
};

auto missing_field(std::string_view field, PacketType type)
    -> std::unexpected<ParseError>
{
    return std::unexpected(ParseError{
        ParseErrorCode::kMissingField,
        fmt::format("missing or invalid field '{}'", field),
        std::string{packet_type_name(type)}
    });
}

// 필수 string 필드
auto required_string(const FieldMap& fields, std::string_view field, PacketType type)
    -> std::expected<std::string, ParseError>
{
    const auto it = fields.find(std::string{field});
    if (it == fields.end() || it->second.kind != FieldValue::Kind::kString) {
        return missing_field(field, type);
    }
    return it->second.text;
}

}  // namespace

// ---------------------------------------------------------------------------
// 판별자 이름 변환
// ---------------------------------------------------------------------------
auto packet_type_name(PacketType type) noexcept -> std::string_view {
    for (const auto& entry : kPacketNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

auto packet_type_from_name(std::string_view name) noexcept -> std::optional<PacketType> {
    for (const auto& entry : kPacketNames) {
        if (entry.name == name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

auto packet_type_display_name(PacketType type) -> std::string {
    const std::string_view name = packet_type_name(type);

    std::string label;
    label.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        const auto c = static_cast<unsigned char>(name[i]);
        if (c == '_') {
            label += ' ';
        } else if (i == 0) {
            label += static_cast<char>(std::toupper(c));
        } else {
            label += static_cast<char>(std::tolower(c));
        }
    }
    return label;
}

// ---------------------------------------------------------------------------
// Packet 생성
// ---------------------------------------------------------------------------
Packet::Packet(Payload payload)
    : payload_{std::move(payload)}
{}

auto Packet::banned() -> Packet {
    return Packet{BannedPacket{}};
}

auto Packet::not_whitelisted() -> Packet {
    return Packet{NotWhitelistedPacket{}};
}

auto Packet::connection_closed(std::optional<std::string> reason) -> Packet {
    return Packet{ConnectionClosedPacket{std::move(reason)}};
}

auto Packet::username(std::string name) -> Packet {
    return Packet{UsernamePacket{std::move(name)}};
}

auto Packet::client_message(std::string message, bool encrypted, std::string chat) -> Packet {
    return Packet{ClientMessagePacket{std::move(message), encrypted, std::move(chat)}};
}

auto Packet::type() const noexcept -> PacketType {
    // variant 인덱스는 PacketType 선언 순서와 동일하다
    return static_cast<PacketType>(payload_.index());
}

auto Packet::payload() const noexcept -> const Payload& {
    return payload_;
}

// ---------------------------------------------------------------------------
// serialize
//   packet_type 을 첫 필드로 두고 종류별 필드를 이어 붙인다.
// ---------------------------------------------------------------------------
auto Packet::serialize() const -> std::string {
    const std::string_view name = packet_type_name(type());

    if (const auto* closed = get_if<ConnectionClosedPacket>()) {
        if (!closed->reason) {
            return fmt::format(R"({{"packet_type":"{}"}})", name);
        }
        return fmt::format(R"({{"packet_type":"{}","reason":"{}"}})",
                           name, escape_json_string(*closed->reason));
    }
    if (const auto* user = get_if<UsernamePacket>()) {
        return fmt::format(R"({{"packet_type":"{}","username":"{}"}})",
                           name, escape_json_string(user->username));
    }
    if (const auto* msg = get_if<ClientMessagePacket>()) {
        return fmt::format(
            R"({{"packet_type":"{}","message":"{}","encrypted":{},"chat":"{}"}})",
            name,
            escape_json_string(msg->message),
            msg->encrypted ? "true" : "false",
            escape_json_string(msg->chat));
    }

    // Banned / NotWhitelisted: 필드 없음
    return fmt::format(R"({{"packet_type":"{}"}})", name);
}

// ---------------------------------------------------------------------------
// parse_record
// ---------------------------------------------------------------------------
auto Packet::parse_record(std::string_view record) -> std::expected<Packet, ParseError> {
    auto fields_result = FlatObjectReader{record}.read();
    if (!fields_result) {
        return std::unexpected(fields_result.error());
    }
    const FieldMap& fields = *fields_result;

    const auto type_it = fields.find(std::string{kTypeField});
    if (type_it == fields.end() || type_it->second.kind != FieldValue::Kind::kString) {
        return std::unexpected(ParseError{
            ParseErrorCode::kUnknownPacketType,
            "missing packet_type",
            {}
        });
    }

    const auto type = packet_type_from_name(type_it->second.text);
    if (!type) {
        return std::unexpected(ParseError{
            ParseErrorCode::kUnknownPacketType,
            "unknown packet_type",
            type_it->second.text.size() > 64
                ? type_it->second.text.substr(0, 64) + "..."
                : type_it->second.text
        });
    }

    switch (*type) {
        case PacketType::kBanned:
            return banned();

        case PacketType::kNotWhitelisted:
            return not_whitelisted();

        case PacketType::kConnectionClosed: {
            const auto it = fields.find("reason");
            if (it == fields.end() || it->second.kind == FieldValue::Kind::kNull) {
                return connection_closed(std::nullopt);
            }
            if (it->second.kind != FieldValue::Kind::kString) {
                return missing_field("reason", *type);
            }
            return connection_closed(it->second.text);
        }

        case PacketType::kUsername: {
            auto name = required_string(fields, "username", *type);
            if (!name) {
                return std::unexpected(name.error());
            }
            return username(std::move(*name));
        }

        case PacketType::kClientMessage: {
            auto message = required_string(fields, "message", *type);
            if (!message) {
                return std::unexpected(message.error());
            }
            auto chat = required_string(fields, "chat", *type);
            if (!chat) {
                return std::unexpected(chat.error());
            }

            // encrypted 누락 시 false
            bool encrypted = false;
            if (const auto it = fields.find("encrypted"); it != fields.end()) {
                if (it->second.kind != FieldValue::Kind::kBool) {
                    return missing_field("encrypted", *type);
                }
                encrypted = it->second.flag;
            }
            return client_message(std::move(*message), encrypted, std::move(*chat));
        }
    }

    return std::unexpected(ParseError{
        ParseErrorCode::kUnknownPacketType,
        "unhandled packet_type",
        type_it->second.text
    });
}
