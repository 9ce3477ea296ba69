#pragma once

#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// escape_json_string
//   JSON 문자열 값으로 넣을 수 있도록 이스케이프한다 (따옴표는 붙이지 않는다).
//   제어 문자는 \uXXXX 로, 0x20 이상 바이트는 UTF-8 그대로 둔다.
//   Packet 직렬화와 StructuredLogger 가 공유한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string escape_json_string(std::string_view str);
