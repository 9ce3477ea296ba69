// ---------------------------------------------------------------------------
// test_connection_writer.cpp
//
// ConnectionWriter 단위 테스트.
//
// [테스트 구성]
// local::stream_protocol 소켓 쌍을 만들고 한쪽을 Stream 으로 변환해 writer 에
// 넘긴다. 반대쪽에서 수신한 바이트로 전송 형식을 검증한다.
//
// [테스트 범위]
// - 레코드 형식: JSON + '\n'
// - close() 이후 send() → kWriterClosed, close() 중복 호출
// - 동시 send(): 레코드가 섞이지 않고 스레드별 순서 유지
// - close_with(): 마지막 패킷 후 EOF, 상대가 읽지 않아도 제한 시간 안에 반환
// ---------------------------------------------------------------------------

#include "server/connection_writer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace asio  = boost::asio;
using LocalSocket = asio::local::stream_protocol::socket;
using namespace std::chrono_literals;

namespace {

// 수신 버퍼를 개행 단위로 나눈다 (마지막 미완성 줄은 제외)
std::vector<std::string> split_lines(const std::string& data) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const auto nl = data.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        lines.push_back(data.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

}  // namespace

class ConnectionWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        LocalSocket server{io_ctx_};
        asio::local::connect_pair(server, peer_);
        stream_ = std::make_unique<Stream>(std::move(server));
        writer_ = std::make_unique<ConnectionWriter>(*stream_);
    }

    // EOF 까지 읽는다. writer 쪽이 송신 방향을 닫아야 반환된다.
    std::string read_to_eof() {
        std::string data;
        boost::system::error_code ec;
        asio::read(peer_, asio::dynamic_buffer(data), ec);
        EXPECT_EQ(ec, asio::error::eof) << ec.message();
        return data;
    }

    asio::io_context                  io_ctx_;
    LocalSocket                       peer_{io_ctx_};
    std::unique_ptr<Stream>           stream_;
    std::unique_ptr<ConnectionWriter> writer_;
};

// ---------------------------------------------------------------------------
// Send_WritesNewlineTerminatedRecord
// ---------------------------------------------------------------------------
TEST_F(ConnectionWriterTest, Send_WritesNewlineTerminatedRecord) {
    ASSERT_TRUE(writer_->send(Packet::banned()).has_value());
    ASSERT_TRUE(writer_->send(Packet::connection_closed("banned")).has_value());
    EXPECT_EQ(writer_->packets_sent(), 2u);

    ASSERT_TRUE(writer_->close().has_value());

    EXPECT_EQ(read_to_eof(),
              "{\"packet_type\":\"BANNED\"}\n"
              "{\"packet_type\":\"CONNECTION_CLOSED\",\"reason\":\"banned\"}\n");
}

// ---------------------------------------------------------------------------
// Send_AfterClose_Fails
// ---------------------------------------------------------------------------
TEST_F(ConnectionWriterTest, Send_AfterClose_Fails) {
    ASSERT_TRUE(writer_->close().has_value());
    EXPECT_TRUE(writer_->closed());

    const auto sent = writer_->send(Packet::not_whitelisted());
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, ErrorCode::kWriterClosed);
    EXPECT_EQ(writer_->packets_sent(), 0u);

    EXPECT_EQ(read_to_eof(), "") << "nothing may be written after close";
}

TEST_F(ConnectionWriterTest, Close_IsIdempotent) {
    EXPECT_TRUE(writer_->close().has_value());
    EXPECT_TRUE(writer_->close().has_value());
    EXPECT_TRUE(writer_->closed());
}

// ---------------------------------------------------------------------------
// Send_ToClosedPeer_ReportsIoError
// ---------------------------------------------------------------------------
TEST_F(ConnectionWriterTest, Send_ToClosedPeer_ReportsIoError) {
    peer_.close();

    // 첫 쓰기는 커널 버퍼에 들어갈 수 있으므로 오류가 날 때까지 반복한다
    std::expected<void, ChatError> sent{};
    for (int i = 0; i < 100 && sent.has_value(); ++i) {
        sent = writer_->send(Packet::username("x"));
    }
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, ErrorCode::kIoError);
}

// ---------------------------------------------------------------------------
// ConcurrentSend_RecordsAreNotInterleaved
//   여러 스레드가 동시에 send() 해도 각 줄은 완전한 레코드 하나이고,
//   같은 스레드가 보낸 레코드는 보낸 순서대로 도착한다.
// ---------------------------------------------------------------------------
TEST_F(ConnectionWriterTest, ConcurrentSend_RecordsAreNotInterleaved) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;

    // 소켓 버퍼가 가득 차지 않도록 수신을 동시에 진행
    std::string received;
    std::thread reader([this, &received] { received = read_to_eof(); });

    std::vector<std::thread> senders;
    for (int t = 0; t < kThreads; ++t) {
        senders.emplace_back([this, t] {
            const std::string padding(512, static_cast<char>('a' + t));
            for (int i = 0; i < kPerThread; ++i) {
                const auto sent = writer_->send(Packet::client_message(
                    padding, false, std::to_string(t) + ":" + std::to_string(i)));
                EXPECT_TRUE(sent.has_value());
            }
        });
    }
    for (auto& th : senders) {
        th.join();
    }
    ASSERT_TRUE(writer_->close().has_value());
    reader.join();

    const auto lines = split_lines(received);
    ASSERT_EQ(lines.size(), static_cast<std::size_t>(kThreads * kPerThread));

    std::map<int, int> next_index;
    for (const auto& line : lines) {
        const auto packet = Packet::parse_record(line);
        ASSERT_TRUE(packet.has_value()) << "corrupted record: " << line.substr(0, 80);

        const auto* msg = packet->get_if<ClientMessagePacket>();
        ASSERT_NE(msg, nullptr);

        const auto colon  = msg->chat.find(':');
        const int  thread = std::stoi(msg->chat.substr(0, colon));
        const int  index  = std::stoi(msg->chat.substr(colon + 1));
        EXPECT_EQ(index, next_index[thread]) << "out of order record from thread " << thread;
        next_index[thread] = index + 1;
        EXPECT_EQ(msg->message, std::string(512, static_cast<char>('a' + thread)));
    }
}

// ---------------------------------------------------------------------------
// CloseWith_SendsLastPacketThenEof
// ---------------------------------------------------------------------------
TEST_F(ConnectionWriterTest, CloseWith_SendsLastPacketThenEof) {
    ASSERT_TRUE(writer_->send(Packet::banned()).has_value());
    ASSERT_TRUE(writer_->close_with(Packet::connection_closed("banned"), 100ms).has_value());
    EXPECT_TRUE(writer_->closed());
    EXPECT_EQ(writer_->packets_sent(), 2u);

    EXPECT_EQ(read_to_eof(),
              "{\"packet_type\":\"BANNED\"}\n"
              "{\"packet_type\":\"CONNECTION_CLOSED\",\"reason\":\"banned\"}\n");

    const auto again = writer_->close_with(Packet::connection_closed(std::nullopt), 100ms);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::kWriterClosed);
}

// ---------------------------------------------------------------------------
// CloseWith_PeerNotReading_ReturnsWithinBound
//   다른 스레드의 send() 가 가득 찬 소켓 버퍼에서 막혀 있어도 close_with() 는
//   wait 직후 반환하고, 막혀 있던 send() 도 오류로 깨어난다.
// ---------------------------------------------------------------------------
TEST_F(ConnectionWriterTest, CloseWith_PeerNotReading_ReturnsWithinBound) {
    std::atomic<int>               sent{0};
    std::expected<void, ChatError> last{};
    std::thread flooder([this, &sent, &last] {
        const auto big = Packet::username(std::string(60000, 'x'));
        while ((last = writer_->send(big)).has_value()) {
            sent.fetch_add(1);
        }
    });

    // send() 가 더 이상 진행하지 않을 때까지 대기 (peer_ 는 읽지 않는다)
    int previous = -1;
    while (sent.load() != previous) {
        previous = sent.load();
        std::this_thread::sleep_for(200ms);
    }
    ASSERT_GT(sent.load(), 0);

    const auto before = std::chrono::steady_clock::now();
    const auto closed = writer_->close_with(Packet::connection_closed("server shutting down"), 100ms);
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);

    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().code, ErrorCode::kIoError);
    EXPECT_TRUE(writer_->closed());

    flooder.join();
    ASSERT_FALSE(last.has_value());
    EXPECT_TRUE(last.error().code == ErrorCode::kIoError ||
                last.error().code == ErrorCode::kWriterClosed)
        << last.error().message;
}
