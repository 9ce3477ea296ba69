#include "protocol/packet_stream.hpp"

#include <fmt/format.h>

// ---------------------------------------------------------------------------
// PacketStreamParser 구현
//
// 버퍼 구조:
//   buffer_[0, pos_)      : 이미 소비한 바이트 (feed() 시 compact)
//   buffer_[pos_, size)   : 아직 처리하지 않은 바이트
//
// 레코드 경계 판정은 문자열 리터럴 내부('"' ... '"', 이스케이프 포함)를
// 제외하고 '{' / '}' / '\n' 만 본다. 레코드는 flat object 이므로
// 내부의 '{' 는 항상 다음 레코드의 시작으로 간주한다.
// ---------------------------------------------------------------------------

namespace {

constexpr std::size_t kSnippetLen = 32;

bool is_separator(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' ||
           c == ',' || c == '[' || c == ']';
}

std::string snippet(std::string_view data) {
    if (data.size() <= kSnippetLen) {
        return std::string{data};
    }
    return std::string{data.substr(0, kSnippetLen)} + "...";
}

auto record_error(ParseErrorCode code, std::string message, std::string_view data)
    -> PacketStreamParser::Item
{
    return std::unexpected(ParseError{code, std::move(message), snippet(data)});
}

}  // namespace

void PacketStreamParser::feed(std::string_view bytes) {
    compact();
    buffer_.append(bytes.data(), bytes.size());
}

auto PacketStreamParser::buffered() const noexcept -> std::size_t {
    return buffer_.size() - pos_;
}

void PacketStreamParser::compact() {
    if (pos_ == 0) {
        return;
    }
    buffer_.erase(0, pos_);
    pos_ = 0;
}

auto PacketStreamParser::next() -> std::optional<Item> {
    const std::string_view view{buffer_};

    while (true) {
        // -------------------------------------------------------------------
        // 초과 크기 레코드 잔여분 버리기
        // -------------------------------------------------------------------
        if (discarding_) {
            const auto nl = view.find('\n', pos_);
            if (nl == std::string_view::npos) {
                pos_ = view.size();
                return std::nullopt;
            }
            pos_          = nl + 1;
            discarding_   = false;
        }

        while (pos_ < view.size() && is_separator(view[pos_])) {
            ++pos_;
        }
        if (pos_ >= view.size()) {
            return std::nullopt;
        }

        // -------------------------------------------------------------------
        // 레코드 밖의 데이터: 다음 '{' 또는 개행까지를 malformed 1개로 처리
        // -------------------------------------------------------------------
        if (view[pos_] != '{') {
            const std::size_t start = pos_;
            const auto end = view.find_first_of("{\n", start);
            if (end == std::string_view::npos) {
                if (view.size() - start > kMaxRecordSize) {
                    pos_        = view.size();
                    discarding_ = true;
                    return record_error(ParseErrorCode::kRecordTooLarge,
                                        "oversized data outside record",
                                        view.substr(start));
                }
                // 종결자가 아직 도착하지 않았다
                return std::nullopt;
            }
            pos_ = end;
            return record_error(ParseErrorCode::kMalformedRecord,
                                "unexpected data outside record",
                                view.substr(start, end - start));
        }

        // -------------------------------------------------------------------
        // 레코드 스캔
        // -------------------------------------------------------------------
        const std::size_t start = pos_;
        bool in_string = false;
        bool escaped   = false;

        for (std::size_t i = start + 1; i < view.size(); ++i) {
            if (i - start >= kMaxRecordSize) {
                pos_        = i;
                discarding_ = true;
                return record_error(ParseErrorCode::kRecordTooLarge,
                                    fmt::format("record exceeds {} bytes", kMaxRecordSize),
                                    view.substr(start));
            }

            const char c = view[i];

            if (c == '\n') {
                pos_ = i + 1;
                return record_error(ParseErrorCode::kMalformedRecord,
                                    "record interrupted by newline",
                                    view.substr(start, i - start));
            }

            if (in_string) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }

            if (c == '"') {
                in_string = true;
            } else if (c == '{') {
                pos_ = i;
                return record_error(ParseErrorCode::kMalformedRecord,
                                    "record interrupted by next record",
                                    view.substr(start, i - start));
            } else if (c == '}') {
                pos_ = i + 1;
                return Packet::parse_record(view.substr(start, i + 1 - start));
            }
        }

        // 레코드가 아직 완성되지 않았다
        if (view.size() - start >= kMaxRecordSize) {
            pos_        = view.size();
            discarding_ = true;
            return record_error(ParseErrorCode::kRecordTooLarge,
                                fmt::format("record exceeds {} bytes", kMaxRecordSize),
                                view.substr(start));
        }
        return std::nullopt;
    }
}
