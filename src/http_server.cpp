#include "http_server.hpp"
#include "http_api.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace encache {

namespace {

// Applies to each read (idle time included) and each write
constexpr std::chrono::seconds kIoTimeout(30);

bool is_quiet_close(const beast::error_code& ec) {
    return ec == net::error::operation_aborted
        || ec == beast::error::timeout
        || ec == net::error::connection_reset
        || ec == net::error::eof;
}

} // namespace

// ==================== HttpSession ====================

/**
 * One client connection
 *
 * Socket operations run on the connection's strand. Routing runs on the
 * worker pool once a whole request has been parsed; the response is then
 * written back from the strand.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, ApiRouter& router, net::io_context& ioc,
                net::thread_pool& pool, const std::atomic<bool>& running)
        : stream_(std::move(socket))
        , router_(router)
        , ioc_(ioc)
        , pool_(pool)
        , running_(running)
        , reading_(false) {
    }

    void start() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

    /**
     * Close the connection if it is waiting for a request
     */
    void close_if_idle() {
        net::post(stream_.get_executor(), [self = shared_from_this()]() {
            if (self->reading_) {
                self->stream_.cancel();
            }
        });
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;

    ApiRouter& router_;
    net::io_context& ioc_;
    net::thread_pool& pool_;
    const std::atomic<bool>& running_;
    bool reading_;

    void do_read() {
        if (!running_) {
            do_close();
            return;
        }
        req_ = {};
        reading_ = true;
        stream_.expires_after(kIoTimeout);
        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        reading_ = false;
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (!is_quiet_close(ec)) {
                std::cerr << "Read failed: " << ec.message() << std::endl;
            }
            return;
        }

        // Keeps ioc_.run() alive while no socket operation is pending
        net::post(pool_, [self = shared_from_this(), work = net::make_work_guard(ioc_)]() {
            self->handle_request();
        });
    }

    // Runs on a pool worker
    void handle_request() {
        ApiResponse api = router_.handle(std::string(req_.method_string()), std::string(req_.target()));

        res_ = {};
        res_.result(static_cast<http::status>(api.status));
        res_.version(req_.version());
        res_.set(http::field::server, "encache");
        if (!api.content_type.empty()) {
            res_.set(http::field::content_type, api.content_type);
        }
        for (const auto& [name, value] : api.headers) {
            res_.set(name, value);
        }
        res_.keep_alive(req_.keep_alive() && running_);
        res_.body() = std::move(api.body);
        res_.prepare_payload();

        net::post(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_write, shared_from_this()));
    }

    void do_write() {
        stream_.expires_after(kIoTimeout);
        http::async_write(stream_, res_,
                          beast::bind_front_handler(&HttpSession::on_write, shared_from_this(),
                                                    res_.keep_alive()));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t) {
        if (ec) {
            if (!is_quiet_close(ec)) {
                std::cerr << "Write failed: " << ec.message() << std::endl;
            }
            return;
        }
        if (!keep_alive) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

// ==================== HttpServer ====================

HttpServer::HttpServer(ApiRouter& router, const std::string& host, uint16_t port, size_t threads)
    : router_(router)
    , host_(host)
    , port_(port)
    , running_(false)
    , acceptor_(ioc_)
    , signals_(ioc_, SIGINT, SIGTERM)
    , pool_(threads == 0 ? 1 : threads) {
}

HttpServer::~HttpServer() {
    stop();
    pool_.join();
}

bool HttpServer::start() {
    beast::error_code ec;
    auto address = net::ip::make_address(host_, ec);
    if (ec) {
        std::cerr << "Invalid listen address " << host_ << ": " << ec.message() << std::endl;
        return false;
    }

    tcp::endpoint endpoint(address, port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
        port_ = acceptor_.local_endpoint(ec).port();
    }
    if (ec) {
        std::cerr << "Failed to listen on " << host_ << ":" << port_ << ": " << ec.message() << std::endl;
        return false;
    }

    running_ = true;
    std::cout << "Listening on " << host_ << ":" << port_ << std::endl;
    return true;
}

void HttpServer::run() {
    if (!running_) {
        return;
    }

    signals_.async_wait([this](const beast::error_code& ec, int signal) {
        if (!ec) {
            std::cout << "Received signal " << signal << ", shutting down" << std::endl;
            stop();
        }
    });

    do_accept();
    ioc_.run();

    pool_.join();
    std::cout << "Server stopped" << std::endl;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    net::post(ioc_, [this]() {
        beast::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        for (const auto& weak : sessions_) {
            if (auto session = weak.lock()) {
                session->close_if_idle();
            }
        }
        sessions_.clear();
    });
}

// ==================== Private Methods ====================

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](const beast::error_code& ec, tcp::socket socket) {
        if (!acceptor_.is_open()) {
            return;
        }
        if (ec) {
            std::cerr << "Accept failed: " << ec.message() << std::endl;
        } else {
            auto session = std::make_shared<HttpSession>(std::move(socket), router_, ioc_, pool_, running_);
            sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                           [](const std::weak_ptr<HttpSession>& weak) {
                                               return weak.expired();
                                           }),
                            sessions_.end());
            sessions_.push_back(session);
            session->start();
        }
        do_accept();
    });
}

} // namespace encache
