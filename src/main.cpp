#include "logger/structured_logger.hpp"
#include "server/chat_server.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    const std::string config_dir = env_str("CHATD_CONFIG_DIR", "config");
    const std::string log_path   = env_str("CHATD_LOG_PATH",   "/tmp/chatd.log");
    const std::string log_level  = env_str("CHATD_LOG_LEVEL",  "info");

    const LogLevel level = parse_log_level(log_level);
    if (level == LogLevel::kDebug) {
        spdlog::set_level(spdlog::level::debug);
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    std::unique_ptr<StructuredLogger> logger;
    try {
        logger = std::make_unique<StructuredLogger>(level, log_path);
    } catch (const std::exception& e) {
        spdlog::critical("cannot initialize logger at '{}': {}", log_path, e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Starting chatd");
    spdlog::info("Config dir: {}", config_dir);
    spdlog::info("Log path: {}", log_path);
    spdlog::info("Log level: {}", log_level);

    // ── ChatServer 생성 및 실행 ─────────────────────────────────────────
    ChatServer server{config_dir, *logger};
    if (auto ready = server.init(); !ready) {
        spdlog::critical("startup failed: {}", ready.error());
        return EXIT_FAILURE;
    }
    server.run();

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("chatd stopped");

    return EXIT_SUCCESS;
}
