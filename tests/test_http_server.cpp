// ==================== HTTP Server Tests ====================

#include <gtest/gtest.h>
#include "encoding_cache.hpp"
#include "http_api.hpp"
#include "http_server.hpp"
#include "test_helpers.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <thread>

using namespace encache;
namespace fs = std::filesystem;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

/**
 * Blocking HTTP/1.1 client on its own connection
 */
class TestClient {
public:
    explicit TestClient(uint16_t port)
        : socket_(ioc_) {
        socket_.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    }

    http::response<http::string_body> get(const std::string& target, bool keep_alive = true) {
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(keep_alive);
        http::write(socket_, req);

        http::response<http::string_body> res;
        http::read(socket_, buffer_, res);
        return res;
    }

    void send_raw(const std::string& text) {
        net::write(socket_, net::buffer(text));
    }

    // True once the server has closed its side
    bool closed_by_peer() {
        char byte;
        beast::error_code ec;
        socket_.read_some(net::buffer(&byte, 1), ec);
        return ec == net::error::eof || ec == net::error::connection_reset;
    }

private:
    net::io_context ioc_;
    tcp::socket socket_;
    beast::flat_buffer buffer_;
};

} // namespace

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<encache_test::TempDir>();
        fs::create_directories(dir_->sub("input"));
        encache_test::write_file(dir_->sub("input/abc.bin"), std::vector<uint8_t>{0x41, 0x42, 0x43});

        CacheConfig config;
        config.input_dir = dir_->sub("input");
        config.cache_dir = dir_->sub("cache");
        cache_ = std::make_unique<EncodingCache>(config);
        router_ = std::make_unique<ApiRouter>(*cache_);

        // A single worker: any connection holding it would starve the others
        server_ = std::make_unique<HttpServer>(*router_, "127.0.0.1", 0, 1);
        ASSERT_TRUE(server_->start());
        ASSERT_NE(server_->port(), 0);
        stopped_ = std::async(std::launch::async, [this]() { server_->run(); });
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        if (stopped_.valid()) {
            stopped_.wait();
        }
        server_.reset();
        router_.reset();
        cache_.reset();
        dir_.reset();
    }

    bool stops_within(std::chrono::seconds limit) {
        return stopped_.wait_for(limit) == std::future_status::ready;
    }

    std::unique_ptr<encache_test::TempDir> dir_;
    std::unique_ptr<EncodingCache> cache_;
    std::unique_ptr<ApiRouter> router_;
    std::unique_ptr<HttpServer> server_;
    std::future<void> stopped_;
};

TEST_F(HttpServerTest, ServesRequestsOverKeepAlive) {
    TestClient client(server_->port());

    auto health = client.get("/health");
    EXPECT_EQ(health.result(), http::status::ok);
    EXPECT_TRUE(health.keep_alive());
    EXPECT_NE(health.body().find("healthy"), std::string::npos);

    auto missing = client.get("/nowhere");
    EXPECT_EQ(missing.result(), http::status::not_found);
    EXPECT_EQ(missing[http::field::content_type], "application/json");
}

TEST_F(HttpServerTest, IdleConnectionDoesNotBlockOthers) {
    TestClient idle(server_->port());
    ASSERT_EQ(idle.get("/health").result(), http::status::ok);

    // Half a request header, never finished
    TestClient stalled(server_->port());
    stalled.send_raw("GET /health HTTP/1.1\r\nHost: 127.0.0.1\r\n");

    auto begin = std::chrono::steady_clock::now();
    TestClient other(server_->port());
    auto response = other.get("/encodings");
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    // The first connection is still usable
    EXPECT_EQ(idle.get("/health").result(), http::status::ok);
}

TEST_F(HttpServerTest, ConnectionCloseClosesTheSocket) {
    TestClient client(server_->port());
    auto response = client.get("/health", false);
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_FALSE(response.keep_alive());
    EXPECT_TRUE(client.closed_by_peer());
}

TEST_F(HttpServerTest, StopDoesNotWaitForIdleConnections) {
    TestClient idle(server_->port());
    ASSERT_EQ(idle.get("/health").result(), http::status::ok);

    server_->stop();
    EXPECT_FALSE(server_->is_running());
    EXPECT_TRUE(stops_within(std::chrono::seconds(5)));
    EXPECT_TRUE(idle.closed_by_peer());
}
