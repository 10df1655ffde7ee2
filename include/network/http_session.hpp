#ifndef BACKUPER_NETWORK_HTTP_SESSION_HPP
#define BACKUPER_NETWORK_HTTP_SESSION_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include "client_config.hpp"
#include "network_error.hpp"
#include "session.hpp"

namespace backuper {
namespace network {

class HttpSession : public Session, public std::enable_shared_from_this<HttpSession> {
public:
    static constexpr std::size_t WRITE_CHUNK_SIZE = 65536;
    static constexpr std::size_t READ_CHUNK_SIZE = 66560;
    static constexpr const char* USER_AGENT = "backuper-client/1.0";

    // Delete copy operations to prevent socket duplication
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    HttpSession(boost::asio::io_context& io_context, const ClientConfig& config);
    ~HttpSession() override;


    // ---- EXCHANGE ----
    // The configured timeout bounds the whole exchange, name resolution included
    void async_exchange(Request request, BodySink& sink, ExchangeHandler handler) override;

protected:
    // Starts the name lookup that leads to on_resolve
    virtual void resolve();

private:
    using tcp = boost::asio::ip::tcp;
    using buffer_body = boost::beast::http::buffer_body;

    // ---- PARAMETERS ----
    ClientConfig config_;

    // Network components, exactly one of the streams exists
    tcp::resolver resolver_;
    boost::asio::steady_timer deadline_;
    boost::asio::ssl::context ssl_context_;
    std::unique_ptr<boost::beast::tcp_stream> plain_stream_;
    std::unique_ptr<boost::beast::ssl_stream<boost::beast::tcp_stream>> tls_stream_;

    // Message state
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<buffer_body> request_;
    std::unique_ptr<boost::beast::http::request_serializer<buffer_body>> serializer_;
    std::unique_ptr<boost::beast::http::response_parser<buffer_body>> parser_;
    std::shared_ptr<BodySource> body_source_;
    std::vector<char> write_chunk_;
    std::vector<char> read_chunk_;

    // Exchange state
    BodySink* sink_ = nullptr;
    ExchangeHandler handler_;
    Response response_;
    bool started_ = false;


    // ---- SETUP ----
    void configure_tls();
    void prepare_request(const Request& request);
    boost::beast::tcp_stream& lowest_layer();
    // Runs operation with whichever stream this session talks through
    template <typename Operation>
    void with_stream(Operation&& operation);


    // ---- CONNECTION ----
    void on_deadline(const boost::system::error_code& ec);
    void on_resolve(const boost::system::error_code& ec, tcp::resolver::results_type results);
    void on_connect(const boost::system::error_code& ec, const tcp::endpoint& endpoint);
    void on_handshake(const boost::system::error_code& ec);


    // ---- OUTGOING REQUEST ----
    void write_header();
    void on_write_header(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void write_body_chunk();
    void on_write_body(boost::system::error_code ec, std::size_t bytes_transferred);


    // ---- INCOMING RESPONSE ----
    void read_header();
    void on_read_header(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void read_body_chunk();
    void on_read_body(boost::system::error_code ec, std::size_t bytes_transferred);
    bool deliver(const char* data, std::size_t size);


    // ---- TEARDOWN ----
    void shutdown();
    void on_shutdown(const boost::system::error_code& ec);
    void fail(const boost::system::error_code& ec, const char* stage);
    void complete(const boost::system::error_code& ec);
    bool finished() const { return !handler_; }
};

class HttpSessionFactory : public SessionFactory {
public:
    HttpSessionFactory(boost::asio::io_context& io_context, const ClientConfig& config);

    std::shared_ptr<Session> create_session() override;

private:
    boost::asio::io_context& io_context_;
    ClientConfig config_;
};

} // namespace network
} // namespace backuper

#endif // BACKUPER_NETWORK_HTTP_SESSION_HPP
