#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace encache {

class ApiRouter;
class HttpSession;

/**
 * HTTP/1.1 server
 *
 * Sockets are read and written asynchronously on the io_context driven by
 * run(). A connection occupies a worker of the fixed-size thread pool only
 * while one fully parsed request is being routed, so idle keep-alive
 * connections cost no worker. Reads and writes time out after 30 seconds.
 * SIGINT/SIGTERM or stop() close the listener and idle connections; requests
 * already being handled get their response before the connection closes.
 */
class HttpServer {
public:
    HttpServer(ApiRouter& router, const std::string& host = "0.0.0.0",
               uint16_t port = 8000, size_t threads = 4);
    ~HttpServer();

    /**
     * Bind and listen
     * @return false if the address cannot be bound
     */
    bool start();

    /**
     * Serve until stop() or a termination signal
     */
    void run();

    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * Bound port (differs from the requested one when that was 0)
     */
    uint16_t port() const { return port_; }

private:
    ApiRouter& router_;
    std::string host_;
    uint16_t port_;
    std::atomic<bool> running_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    boost::asio::thread_pool pool_;

    // Open connections, touched only on the io_context thread
    std::vector<std::weak_ptr<HttpSession>> sessions_;

    void do_accept();
};

} // namespace encache

#endif // HTTP_SERVER_HPP
