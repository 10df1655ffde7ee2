#ifndef BACKUPER_NETWORK_SESSION_HPP
#define BACKUPER_NETWORK_SESSION_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <boost/beast/http/verb.hpp>
#include <boost/system/error_code.hpp>
#include "message_body.hpp"

namespace backuper {
namespace network {

struct Request {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    // Path below the server's base path, e.g. "/list_data"
    std::string target;
    // Optional request body, nullptr for none
    std::shared_ptr<BodySource> body;
};

struct Response {
    unsigned status = 0;
    // Body text of a non-200 response; a 200 body goes to the sink instead
    std::string body;
    // Bytes handed to the sink
    std::uint64_t bytes_received = 0;
};

// One HTTP request/response exchange. A session is used for exactly one exchange.
class Session {
public:
    using ExchangeHandler = std::function<void(const boost::system::error_code&, Response)>;

    virtual ~Session() = default;

    // Starts the exchange. The handler runs exactly once, from the
    // io_context the session was created on. The sink must outlive the exchange.
    virtual void async_exchange(Request request, BodySink& sink, ExchangeHandler handler) = 0;

protected:
    Session() = default;
};

class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual std::shared_ptr<Session> create_session() = 0;

protected:
    SessionFactory() = default;
};

} // namespace network
} // namespace backuper

#endif // BACKUPER_NETWORK_SESSION_HPP
