#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   listener/handler 는 StructuredLogger& 를 받아 보고한다.
// - 로깅 호출은 예외를 밖으로 던지지 않는다. 연결 처리 경로가
//   로그 실패로 중단되지 않도록 모든 공개 메서드는 noexcept.
//
// [JSON 스키마]
// 모든 ConnectionLog 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   ConnectionLog 를 JSON 한 줄로 기록한다.
//   세 가지 심각도(info/warn/error) 와 debug 진단 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   실패 시 std::runtime_error (기동 단계에서만 생성한다)
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = delete;
    StructuredLogger& operator=(StructuredLogger&&)      = delete;

    // log_connection
    //   연결 이벤트를 JSON 으로 기록한다.
    //   connect/disconnect 는 info, banned/not_whitelisted/rejected 는 warn.
    void log_connection(const ConnectionLog& entry) noexcept;

    void debug(std::string_view msg) noexcept;
    void info(std::string_view msg) noexcept;
    void warn(std::string_view msg) noexcept;
    void error(std::string_view msg) noexcept;

    // 버퍼에 남은 로그를 싱크로 내보낸다 (종료 시/테스트용)
    void flush() noexcept;

    [[nodiscard]] auto min_level() const noexcept -> LogLevel { return min_level_; }

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
