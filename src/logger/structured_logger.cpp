// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "common/json_escape.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "chatd";

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto seconds     = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto millis      =
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds);

    const std::time_t time_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_val, &tm_val);

    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_val);
    return fmt::format("{}.{:03}Z", buf, millis.count());
}

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// connect/disconnect 는 정상 흐름, 나머지는 접근 거부
LogLevel connection_event_level(ConnectionEvent event) noexcept {
    switch (event) {
        case ConnectionEvent::kConnect:
        case ConnectionEvent::kDisconnect:
            return LogLevel::kInfo;
        case ConnectionEvent::kBanned:
        case ConnectionEvent::kNotWhitelisted:
        case ConnectionEvent::kRejected:
            return LogLevel::kWarn;
    }
    return LogLevel::kInfo;
}

}  // namespace

auto parse_log_level(std::string_view text) noexcept -> LogLevel {
    if (text == "debug") { return LogLevel::kDebug; }
    if (text == "warn")  { return LogLevel::kWarn;  }
    if (text == "error") { return LogLevel::kError; }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // 싱크: stdout + rotating file (100MB, 3개 파일 유지)
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        constexpr std::size_t kMaxFileSize = 100U * 1024U * 1024U;
        constexpr std::size_t kMaxFiles    = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        // 전역 레지스트리에 등록하지 않는다 (인스턴스가 여러 개일 수 있음)
        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 타임스탬프만 앞에 붙인다
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    flush();
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(level) >= static_cast<int>(min_level_);
}

// ---------------------------------------------------------------------------
// log_connection: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_connection(const ConnectionLog& entry) noexcept {
    const LogLevel level = connection_event_level(entry.event);
    if (!enabled(level)) {
        return;
    }

    try {
        const std::string reason_json = entry.reason
            ? fmt::format("\"{}\"", escape_json_string(*entry.reason))
            : std::string{"null"};

        const std::string json = fmt::format(
            R"({{"event":"{}","connection_id":{},"remote_address":"{}","remote_port":{},)"
            R"("reason":{},"invalid_packets":{},"timestamp":"{}"}})",
            connection_event_name(entry.event),
            entry.connection_id,
            escape_json_string(entry.remote_address),
            entry.remote_port,
            reason_json,
            entry.invalid_packets,
            format_iso8601(entry.timestamp));

        logger_->log(to_spdlog_level(level), json);
    } catch (const std::exception& ex) {
        spdlog::error("[logger] failed to write connection log: {}", ex.what());
    }
}

// ---------------------------------------------------------------------------
// 진단용 spdlog 래퍼
//   spdlog 는 포맷 오류를 내부 error handler 로 처리하므로 여기서는 예외가 없다.
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) noexcept {
    if (enabled(LogLevel::kDebug)) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) noexcept {
    if (enabled(LogLevel::kInfo)) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) noexcept {
    if (enabled(LogLevel::kWarn)) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) noexcept {
    if (enabled(LogLevel::kError)) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() noexcept {
    if (logger_) {
        logger_->flush();
    }
}
