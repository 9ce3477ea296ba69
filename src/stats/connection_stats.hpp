#pragma once

// ---------------------------------------------------------------------------
// connection_stats.hpp
//
// 연결 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_* 갱신 메서드: listener / 모든 handler 스레드에서 concurrent 호출 안전.
// - snapshot(): 갱신 경로와 mutex 없이 atomic 로드로 읽는다.
//   필드 간 일관성은 보장하지 않는다 (진단용 근사치).
//
// [격리 원칙]
// - 통계 갱신 실패가 연결 처리로 전파되지 않도록 모든 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// ConnectionStatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
// ---------------------------------------------------------------------------
struct ConnectionStatsSnapshot {
    std::uint64_t                         total_connections{0};
    std::uint64_t                         active_connections{0};
    std::uint64_t                         banned_connections{0};
    std::uint64_t                         rejected_connections{0};
    std::uint64_t                         invalid_packets{0};
    std::uint64_t                         routed_packets{0};
    std::chrono::system_clock::time_point captured_at{};
};

class ConnectionStats {
public:
    ConnectionStats() noexcept = default;
    ~ConnectionStats()         = default;

    ConnectionStats(const ConnectionStats&)            = delete;
    ConnectionStats& operator=(const ConnectionStats&) = delete;
    ConnectionStats(ConnectionStats&&)                 = delete;
    ConnectionStats& operator=(ConnectionStats&&)      = delete;

    // on_connection_open: registry 등록 시
    void on_connection_open() noexcept {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        active_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    // on_connection_close: registry 해제 시. 0 아래로 내려가지 않는다.
    void on_connection_close() noexcept {
        std::uint64_t current = active_connections_.load(std::memory_order_relaxed);
        while (current > 0 &&
               !active_connections_.compare_exchange_weak(
                   current, current - 1, std::memory_order_relaxed)) {
        }
    }

    void on_banned() noexcept {
        banned_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    // not whitelisted 또는 handler 생성 실패
    void on_rejected() noexcept {
        rejected_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_invalid_packet() noexcept {
        invalid_packets_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_packet_routed() noexcept {
        routed_packets_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] ConnectionStatsSnapshot snapshot() const noexcept {
        return ConnectionStatsSnapshot{
            .total_connections    = total_connections_.load(std::memory_order_relaxed),
            .active_connections   = active_connections_.load(std::memory_order_relaxed),
            .banned_connections   = banned_connections_.load(std::memory_order_relaxed),
            .rejected_connections = rejected_connections_.load(std::memory_order_relaxed),
            .invalid_packets      = invalid_packets_.load(std::memory_order_relaxed),
            .routed_packets       = routed_packets_.load(std::memory_order_relaxed),
            .captured_at          = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_connections_{0};
    std::atomic<std::uint64_t> active_connections_{0};
    std::atomic<std::uint64_t> banned_connections_{0};
    std::atomic<std::uint64_t> rejected_connections_{0};
    std::atomic<std::uint64_t> invalid_packets_{0};
    std::atomic<std::uint64_t> routed_packets_{0};
};
