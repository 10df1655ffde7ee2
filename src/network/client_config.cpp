#include "network/client_config.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace backuper {
namespace network {

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

std::string default_port(const std::string& scheme) {
  return scheme == "https" ? "443" : "80";
}

void validate_port(const std::string& port, const std::string& url) {
  if (port.empty() || port.size() > 5 ||
      !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw std::invalid_argument("Invalid port in server address: " + url);
  }
  const unsigned long value = std::stoul(port);
  if (value == 0 || value > 65535) {
    throw std::invalid_argument("Port out of range in server address: " + url);
  }
}

} // namespace

std::string ServerEndpoint::host_header() const {
  std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port == default_port(scheme)) {
    return host_part;
  }
  return host_part + ":" + port;
}


//==============================================
// CONSTRUCTOR
//==============================================

ClientConfig::ClientConfig(const std::string& server_url,
                           std::chrono::milliseconds timeout,
                           bool tls_strict)
  : base_url_(normalize_server_url(server_url))
  , timeout_(timeout)
  , tls_strict_(tls_strict)
  , endpoint_(parse_endpoint(base_url_)) {

  if (timeout_.count() <= 0) {
    throw std::invalid_argument("Timeout must be positive");
  }

  BOOST_LOG_TRIVIAL(debug) << "Client config: Server " << base_url_
                           << " (host " << endpoint_.host << ", port " << endpoint_.port
                           << "), timeout " << timeout_.count() << " ms, "
                           << (tls_strict_ ? "strict" : "loose") << " TLS";
}


//==============================================
// ADDRESS HANDLING
//==============================================

std::string ClientConfig::normalize_server_url(const std::string& url) {
  if (starts_with(url, "http://") || starts_with(url, "https://")) {
    return url;
  }
  return "http://" + url;
}

ServerEndpoint ClientConfig::parse_endpoint(const std::string& normalized_url) {
  ServerEndpoint endpoint;

  const std::size_t scheme_end = normalized_url.find("://");
  if (scheme_end == std::string::npos) {
    throw std::invalid_argument("Missing scheme in server address: " + normalized_url);
  }
  endpoint.scheme = normalized_url.substr(0, scheme_end);
  if (endpoint.scheme != "http" && endpoint.scheme != "https") {
    throw std::invalid_argument("Unsupported scheme in server address: " + normalized_url);
  }

  // Authority runs up to the first slash, the rest is the base path
  std::string rest = normalized_url.substr(scheme_end + 3);
  const std::size_t path_start = rest.find('/');
  std::string authority = rest.substr(0, path_start);
  if (path_start != std::string::npos) {
    endpoint.base_path = rest.substr(path_start);
    while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
      endpoint.base_path.pop_back();
    }
  }

  std::string port;
  if (!authority.empty() && authority.front() == '[') {
    const std::size_t closing = authority.find(']');
    if (closing == std::string::npos) {
      throw std::invalid_argument("Unterminated IPv6 address in server address: " + normalized_url);
    }
    endpoint.host = authority.substr(1, closing - 1);
    std::string remainder = authority.substr(closing + 1);
    if (!remainder.empty()) {
      if (remainder.front() != ':') {
        throw std::invalid_argument("Invalid server address: " + normalized_url);
      }
      port = remainder.substr(1);
      validate_port(port, normalized_url);
    }
  } else {
    const std::size_t colon = authority.rfind(':');
    endpoint.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port = authority.substr(colon + 1);
      validate_port(port, normalized_url);
    }
  }

  if (endpoint.host.empty()) {
    throw std::invalid_argument("Missing host in server address: " + normalized_url);
  }

  endpoint.port = port.empty() ? default_port(endpoint.scheme) : port;
  return endpoint;
}

} // namespace network
} // namespace backuper
