// ---------------------------------------------------------------------------
// test_chat_server.cpp
//
// ChatServer 통합 테스트.
//
// [테스트 구성]
// - 임시 설정 디렉터리에 server.yaml / banned.yaml / whitelist.yaml 작성
// - 비어 있는 포트를 미리 찾아 server.yaml 에 기록한 뒤 init() → run() (별도 스레드)
// - 클라이언트는 loopback TCP 로 접속한다.
//
// [테스트 범위]
// - 기동 실패: server.yaml 없음, 잘못된 listen_address
// - banned.yaml 변경이 감시자를 통해 새 연결에 반영됨
// - stop(): 활성 연결에 ConnectionClosed("server shutting down") 후 run() 반환
// ---------------------------------------------------------------------------

#include "server/chat_server.hpp"

#include "config/config_loader.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

namespace asio = boost::asio;
namespace fs   = std::filesystem;
using namespace std::chrono_literals;

namespace {

// 커널이 고른 빈 포트를 돌려준다
std::uint16_t pick_free_port() {
    asio::io_context ctx;
    asio::ip::tcp::acceptor acceptor{ctx, {asio::ip::make_address("127.0.0.1"), 0}};
    return acceptor.local_endpoint().port();
}

template <typename Pred>
bool wait_until(std::chrono::milliseconds timeout, Pred pred) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

}  // namespace

class ChatServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "chatd_test_server" / info->name();
        fs::remove_all(dir_);
        fs::create_directories(dir_ / "config");
        logger_ = std::make_unique<StructuredLogger>(LogLevel::kInfo, dir_ / "chatd.log");
    }

    void TearDown() override {
        logger_.reset();
        fs::remove_all(dir_);
    }

    void write(std::string_view name, std::string_view content) const {
        std::ofstream out(dir_ / "config" / name, std::ios::trunc);
        out << content;
    }

    void write_server_yaml(std::uint16_t port, std::string_view address = "127.0.0.1") const {
        write(kSettingsFileName, fmt::format(
            "server:\n"
            "  listen_address: \"{}\"\n"
            "  port: {}\n"
            "  io_threads: 2\n"
            "  shutdown_grace_millis: 1000\n",
            address, port));
    }

    // EOF 까지 읽은 내용
    static std::string read_to_eof(asio::ip::tcp::socket& socket) {
        std::string data;
        boost::system::error_code ec;
        asio::read(socket, asio::dynamic_buffer(data), ec);
        EXPECT_EQ(ec, asio::error::eof) << ec.message();
        return data;
    }

    fs::path                          dir_;
    std::unique_ptr<StructuredLogger> logger_;
};

TEST_F(ChatServerTest, Init_FailsWithoutServerYaml) {
    ChatServer server{dir_ / "config", *logger_};
    const auto ready = server.init();
    ASSERT_FALSE(ready.has_value());
    EXPECT_NE(ready.error().find("server.yaml"), std::string::npos) << ready.error();
}

TEST_F(ChatServerTest, Init_FailsWithInvalidListenAddress) {
    write_server_yaml(pick_free_port(), "not-an-address");
    ChatServer server{dir_ / "config", *logger_};
    EXPECT_FALSE(server.init().has_value());
}

// ---------------------------------------------------------------------------
// BanListChange_AppliesToNewConnections
// ---------------------------------------------------------------------------
TEST_F(ChatServerTest, BanListChange_AppliesToNewConnections) {
    const auto port = pick_free_port();
    write_server_yaml(port);

    ChatServer server{dir_ / "config", *logger_};
    ASSERT_TRUE(server.init().has_value());
    EXPECT_EQ(server.local_endpoint().port(), port);

    std::thread runner([&server] { server.run(); });
    ASSERT_TRUE(wait_until(2s, [&] { return server.running(); }));

    asio::io_context client_ctx;
    const asio::ip::tcp::endpoint target{asio::ip::make_address("127.0.0.1"), port};

    // 1. ban 전: ACTIVE
    asio::ip::tcp::socket first{client_ctx};
    first.connect(target);
    ASSERT_TRUE(wait_until(2s, [&] { return server.listener().handler_count() == 1; }));

    // 2. banned.yaml 작성 → 감시자가 반영
    write(kBannedFileName, "- 127.0.0.1\n");
    ASSERT_TRUE(wait_until(3s, [&] { return server.access().is_banned("127.0.0.1"); }))
        << "ban list change was not picked up by the watcher";

    // 3. 새 연결은 Banned
    asio::ip::tcp::socket second{client_ctx};
    second.connect(target);
    EXPECT_EQ(read_to_eof(second),
              "{\"packet_type\":\"BANNED\"}\n"
              "{\"packet_type\":\"CONNECTION_CLOSED\",\"reason\":\"banned\"}\n");

    // 4. 기존 연결은 유지되다가 stop() 에서 종료
    server.stop();
    EXPECT_EQ(read_to_eof(first),
              "{\"packet_type\":\"CONNECTION_CLOSED\",\"reason\":\"server shutting down\"}\n");

    runner.join();
    EXPECT_FALSE(server.running());
    EXPECT_EQ(server.stats().snapshot().banned_connections, 1u);
    EXPECT_EQ(server.stats().snapshot().active_connections, 0u);
}

TEST_F(ChatServerTest, Stop_WithoutConnectionsReturnsPromptly) {
    write_server_yaml(pick_free_port());

    ChatServer server{dir_ / "config", *logger_};
    ASSERT_TRUE(server.init().has_value());

    std::thread runner([&server] { server.run(); });
    ASSERT_TRUE(wait_until(2s, [&] { return server.running(); }));

    const auto before = std::chrono::steady_clock::now();
    server.stop();
    server.stop();
    runner.join();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
}
