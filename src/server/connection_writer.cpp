#include "server/connection_writer.hpp"

#include <boost/asio/write.hpp>

#include <fmt/format.h>

#include <string>
#include <utility>

ConnectionWriter::ConnectionWriter(Stream& stream)
    : stream_{stream}
{}

auto ConnectionWriter::send(const Packet& packet) -> std::expected<void, ChatError> {
    std::string record = packet.serialize();
    record.push_back('\n');

    std::lock_guard lock{mutex_};
    if (closed_) {
        return std::unexpected(ChatError{
            ErrorCode::kWriterClosed, "writer closed",
            std::string{packet_type_name(packet.type())}});
    }

    boost::system::error_code ec;
    boost::asio::write(stream_, boost::asio::buffer(record), ec);
    if (ec) {
        return std::unexpected(ChatError{
            ErrorCode::kIoError,
            std::string{"failed to send "} + std::string{packet_type_name(packet.type())},
            ec.message()});
    }

    ++packets_sent_;
    return {};
}

auto ConnectionWriter::close() -> std::expected<void, ChatError> {
    std::lock_guard lock{mutex_};
    if (closed_) {
        return {};
    }
    closed_ = true;

    if (auto failed = shutdown_send_locked()) {
        return std::unexpected(std::move(*failed));
    }
    return {};
}

// ---------------------------------------------------------------------------
// close_with
//   1. mutex_ 를 wait 동안 시도. 실패하면 앞선 send() 가 상대 때문에 막힌 것이므로
//      shutdown_both 로 깨운 뒤 잠금을 얻어 닫는다.
//   2. non-blocking 쓰기 한 번. would_block 이면 마지막 패킷을 버린다.
//   3. 송신 방향 shutdown.
// ---------------------------------------------------------------------------
auto ConnectionWriter::close_with(const Packet& last, std::chrono::milliseconds wait)
    -> std::expected<void, ChatError>
{
    const std::string name{packet_type_name(last.type())};
    std::string record = last.serialize();
    record.push_back('\n');

    std::unique_lock lock{mutex_, std::defer_lock};
    if (!lock.try_lock_for(wait)) {
        boost::system::error_code ec;
        stream_.shutdown(Stream::shutdown_both, ec);
        lock.lock();
        closed_ = true;
        return std::unexpected(ChatError{
            ErrorCode::kIoError, "peer is not reading, dropped " + name,
            fmt::format("writer busy for {}ms", wait.count())});
    }

    if (closed_) {
        return std::unexpected(ChatError{ErrorCode::kWriterClosed, "writer closed", name});
    }
    closed_ = true;

    std::optional<ChatError> failure;
    if (stream_.is_open()) {
        boost::system::error_code ec;
        stream_.non_blocking(true, ec);
        if (!ec) {
            boost::asio::write(stream_, boost::asio::buffer(record), ec);
        }
        if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
            failure = ChatError{ErrorCode::kIoError, "send buffer full, dropped " + name,
                                ec.message()};
        } else if (ec) {
            failure = ChatError{ErrorCode::kIoError, "failed to send " + name, ec.message()};
        } else {
            ++packets_sent_;
        }
    }

    auto shutdown_failed = shutdown_send_locked();
    if (!failure) {
        failure = std::move(shutdown_failed);
    }
    if (failure) {
        return std::unexpected(std::move(*failure));
    }
    return {};
}

auto ConnectionWriter::shutdown_send_locked() -> std::optional<ChatError> {
    if (!stream_.is_open()) {
        return std::nullopt;
    }

    boost::system::error_code ec;
    stream_.shutdown(Stream::shutdown_send, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        return ChatError{ErrorCode::kIoError, "failed to shut down send direction", ec.message()};
    }
    return std::nullopt;
}

bool ConnectionWriter::closed() const {
    std::lock_guard lock{mutex_};
    return closed_;
}

auto ConnectionWriter::packets_sent() const -> std::uint64_t {
    std::lock_guard lock{mutex_};
    return packets_sent_;
}
