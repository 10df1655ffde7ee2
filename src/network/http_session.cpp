#include "network/http_session.hpp"
#include <limits>
#include <utility>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <boost/log/trivial.hpp>

namespace backuper {
namespace network {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpSession::HttpSession(boost::asio::io_context& io_context, const ClientConfig& config)
  : config_(config)
  , resolver_(io_context)
  , deadline_(io_context)
  , ssl_context_(ssl::context::tls_client)
  , write_chunk_(WRITE_CHUNK_SIZE)
  , read_chunk_(READ_CHUNK_SIZE) {

  if (config_.endpoint().use_tls()) {
    configure_tls();
    tls_stream_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(io_context, ssl_context_);
    if (config_.tls_strict()) {
      tls_stream_->set_verify_callback(ssl::host_name_verification(config_.endpoint().host));
    }
  } else {
    plain_stream_ = std::make_unique<beast::tcp_stream>(io_context);
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Created for " << config_.base_url();
}

HttpSession::~HttpSession() {
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Destroyed";
}


//==============================================
// SETUP
//==============================================

void HttpSession::configure_tls() {
  if (!config_.tls_strict()) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: TLS certificate verification disabled";
    ssl_context_.set_verify_mode(ssl::verify_none);
    return;
  }

  boost::system::error_code ec;
  ssl_context_.set_default_verify_paths(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP session: Failed to load system trust store: " << ec.message();
  }
  ssl_context_.set_verify_mode(ssl::verify_peer);
}

void HttpSession::prepare_request(const Request& request) {
  const ServerEndpoint& endpoint = config_.endpoint();

  request_.method(request.method);
  request_.target(endpoint.base_path + request.target);
  request_.version(11);
  request_.set(http::field::host, endpoint.host_header());
  request_.set(http::field::user_agent, USER_AGENT);

  if (body_source_) {
    request_.set(http::field::content_type, body_source_->content_type());
    request_.content_length(body_source_->size());
  }

  request_.body().data = nullptr;
  request_.body().size = 0;
  request_.body().more = static_cast<bool>(body_source_);
}

beast::tcp_stream& HttpSession::lowest_layer() {
  if (tls_stream_) {
    return beast::get_lowest_layer(*tls_stream_);
  }
  return *plain_stream_;
}

template <typename Operation>
void HttpSession::with_stream(Operation&& operation) {
  if (tls_stream_) {
    operation(*tls_stream_);
  } else {
    operation(*plain_stream_);
  }
}


//==============================================
// EXCHANGE
//==============================================

void HttpSession::async_exchange(Request request, BodySink& sink, ExchangeHandler handler) {
  if (started_) {
    BOOST_LOG_TRIVIAL(error) << "HTTP session: Session already used for an exchange";
    boost::asio::post(resolver_.get_executor(), [handler = std::move(handler)]() {
      handler(boost::asio::error::already_started, Response{});
    });
    return;
  }
  started_ = true;

  sink_ = &sink;
  handler_ = std::move(handler);
  body_source_ = std::move(request.body);
  prepare_request(request);

  BOOST_LOG_TRIVIAL(info) << "HTTP session: " << request_.method_string() << " "
                          << config_.base_url() << request.target;

  // One deadline for the whole exchange, it is not renewed between operations
  deadline_.expires_after(config_.timeout());
  deadline_.async_wait(
    std::bind(&HttpSession::on_deadline, shared_from_this(),
              std::placeholders::_1));

  resolve();
}


//==============================================
// CONNECTION
//==============================================

void HttpSession::resolve() {
  const ServerEndpoint& endpoint = config_.endpoint();
  resolver_.async_resolve(endpoint.host, endpoint.port,
    std::bind(&HttpSession::on_resolve, shared_from_this(),
              std::placeholders::_1,
              std::placeholders::_2));
}

void HttpSession::on_deadline(const boost::system::error_code& ec) {
  // Aborted when the exchange completes first
  if (ec == boost::asio::error::operation_aborted || finished()) {
    return;
  }

  // Only the TLS close_notify was still outstanding
  if (parser_ && parser_->is_done()) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Deadline reached during TLS shutdown";
    complete({});
    return;
  }
  fail(beast::error::timeout, "complete the exchange in time");
}

void HttpSession::on_resolve(const boost::system::error_code& ec, tcp::resolver::results_type results) {
  if (finished()) {
    return;
  }
  if (ec) {
    fail(ec, "resolve");
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Resolved " << config_.endpoint().host
                           << " to " << results.size() << " endpoint(s)";

  lowest_layer().async_connect(results,
    std::bind(&HttpSession::on_connect, shared_from_this(),
              std::placeholders::_1,
              std::placeholders::_2));
}

void HttpSession::on_connect(const boost::system::error_code& ec, const tcp::endpoint& endpoint) {
  if (finished()) {
    return;
  }
  if (ec) {
    fail(ec, "connect");
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Connected to " << endpoint;

  if (!tls_stream_) {
    write_header();
    return;
  }

  // SNI, many hosts need it to pick the right certificate
  if (!SSL_set_tlsext_host_name(tls_stream_->native_handle(), config_.endpoint().host.c_str())) {
    boost::system::error_code sni_ec(static_cast<int>(::ERR_get_error()),
                                     boost::asio::error::get_ssl_category());
    fail(sni_ec, "set TLS server name");
    return;
  }

  tls_stream_->async_handshake(ssl::stream_base::client,
    std::bind(&HttpSession::on_handshake, shared_from_this(),
              std::placeholders::_1));
}

void HttpSession::on_handshake(const boost::system::error_code& ec) {
  if (finished()) {
    return;
  }
  if (ec) {
    fail(ec, "TLS handshake");
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP session: TLS handshake complete";
  write_header();
}


//==============================================
// OUTGOING REQUEST
//==============================================

void HttpSession::write_header() {
  serializer_ = std::make_unique<http::request_serializer<buffer_body>>(request_);

  auto self = shared_from_this();
  with_stream([this, self](auto& stream) {
    http::async_write_header(stream, *serializer_,
      std::bind(&HttpSession::on_write_header, self,
                std::placeholders::_1,
                std::placeholders::_2));
  });
}

void HttpSession::on_write_header(const boost::system::error_code& ec, std::size_t bytes_transferred) {
  if (finished()) {
    return;
  }
  if (ec) {
    fail(ec, "write request header");
    return;
  }

  BOOST_LOG_TRIVIAL(trace) << "HTTP session: Wrote " << bytes_transferred << " header bytes";
  write_body_chunk();
}

void HttpSession::write_body_chunk() {
  std::size_t produced = 0;
  if (body_source_) {
    produced = body_source_->read(write_chunk_.data(), write_chunk_.size());
    if (body_source_->failed()) {
      fail(NetworkError::SOURCE_READ_FAILED, "read request body");
      return;
    }
  }

  auto& body = request_.body();
  if (produced == 0) {
    body.data = nullptr;
    body.size = 0;
    body.more = false;
  } else {
    body.data = write_chunk_.data();
    body.size = produced;
    body.more = true;
  }

  auto self = shared_from_this();
  with_stream([this, self](auto& stream) {
    http::async_write(stream, *serializer_,
      std::bind(&HttpSession::on_write_body, self,
                std::placeholders::_1,
                std::placeholders::_2));
  });
}

void HttpSession::on_write_body(boost::system::error_code ec, std::size_t bytes_transferred) {
  // Completed by the deadline while this operation was in flight
  if (finished()) {
    return;
  }
  // need_buffer only means the current chunk was consumed
  if (ec == http::error::need_buffer) {
    ec = {};
  }
  if (ec) {
    fail(ec, "write request body");
    return;
  }

  BOOST_LOG_TRIVIAL(trace) << "HTTP session: Wrote " << bytes_transferred << " body bytes";

  if (serializer_->is_done()) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Request sent";
    read_header();
  } else {
    write_body_chunk();
  }
}


//==============================================
// INCOMING RESPONSE
//==============================================

void HttpSession::read_header() {
  parser_ = std::make_unique<http::response_parser<buffer_body>>();
  // Downloads may be arbitrarily large, they are streamed to the sink
  parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());

  auto self = shared_from_this();
  with_stream([this, self](auto& stream) {
    http::async_read_header(stream, buffer_, *parser_,
      std::bind(&HttpSession::on_read_header, self,
                std::placeholders::_1,
                std::placeholders::_2));
  });
}

void HttpSession::on_read_header(const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
  if (finished()) {
    return;
  }
  if (ec) {
    fail(ec, "read response header");
    return;
  }

  response_.status = parser_->get().result_int();
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Response status " << response_.status;

  if (response_.status == 200 && !sink_->open()) {
    fail(NetworkError::SINK_OPEN_FAILED, "open response destination");
    return;
  }

  if (parser_->is_done()) {
    shutdown();
  } else {
    read_body_chunk();
  }
}

void HttpSession::read_body_chunk() {
  auto& body = parser_->get().body();
  body.data = read_chunk_.data();
  body.size = read_chunk_.size();

  auto self = shared_from_this();
  with_stream([this, self](auto& stream) {
    http::async_read(stream, buffer_, *parser_,
      std::bind(&HttpSession::on_read_body, self,
                std::placeholders::_1,
                std::placeholders::_2));
  });
}

void HttpSession::on_read_body(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
  if (finished()) {
    return;
  }
  // need_buffer means the chunk is full, not that anything went wrong
  if (ec == http::error::need_buffer) {
    ec = {};
  }
  if (ec) {
    fail(ec, "read response body");
    return;
  }

  const std::size_t filled = read_chunk_.size() - parser_->get().body().size;
  if (filled > 0 && !deliver(read_chunk_.data(), filled)) {
    fail(NetworkError::SINK_WRITE_FAILED, "write response body");
    return;
  }

  if (parser_->is_done()) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Response received";
    shutdown();
  } else {
    read_body_chunk();
  }
}

bool HttpSession::deliver(const char* data, std::size_t size) {
  if (response_.status != 200) {
    response_.body.append(data, size);
    return true;
  }

  if (!sink_->write(data, size)) {
    return false;
  }
  response_.bytes_received += size;
  BOOST_LOG_TRIVIAL(trace) << "HTTP session: Delivered " << response_.bytes_received << " bytes";
  return true;
}


//==============================================
// TEARDOWN
//==============================================

void HttpSession::shutdown() {
  if (!tls_stream_) {
    boost::system::error_code ec;
    plain_stream_->socket().shutdown(tcp::socket::shutdown_both, ec);
    complete({});
    return;
  }

  tls_stream_->async_shutdown(
    std::bind(&HttpSession::on_shutdown, shared_from_this(),
              std::placeholders::_1));
}

void HttpSession::on_shutdown(const boost::system::error_code& ec) {
  if (finished()) {
    return;
  }
  // Servers commonly close without close_notify, the response is already complete
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: TLS shutdown: " << ec.message();
  }
  complete({});
}

void HttpSession::fail(const boost::system::error_code& ec, const char* stage) {
  // The caller reports the fault, this is only the trail
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: Failed to " << stage << ": " << ec.message();
  complete(ec);
}

void HttpSession::complete(const boost::system::error_code& ec) {
  if (finished()) {
    return;
  }

  // Release the socket and the deadline before handing the result over
  deadline_.cancel();
  resolver_.cancel();
  lowest_layer().close();

  ExchangeHandler handler = std::move(handler_);
  handler_ = nullptr;
  handler(ec, std::move(response_));
}


//==============================================
// SESSION FACTORY
//==============================================

HttpSessionFactory::HttpSessionFactory(boost::asio::io_context& io_context, const ClientConfig& config)
  : io_context_(io_context)
  , config_(config) {
}

std::shared_ptr<Session> HttpSessionFactory::create_session() {
  return std::make_shared<HttpSession>(io_context_, config_);
}

} // namespace network
} // namespace backuper
