#ifndef BACKUPER_NETWORK_CLIENT_CONFIG_HPP
#define BACKUPER_NETWORK_CLIENT_CONFIG_HPP

#include <chrono>
#include <string>

namespace backuper {
namespace network {

struct ServerEndpoint {
    std::string scheme;     // "http" or "https"
    std::string host;       // without IPv6 brackets
    std::string port;
    std::string base_path;  // empty or "/prefix", never a trailing slash

    bool use_tls() const { return scheme == "https"; }
    // Value for the Host header, port omitted when it is the scheme default
    std::string host_header() const;
};

class ClientConfig {
public:
    static constexpr const char* DEFAULT_SERVER_URL = "localhost:44987";
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{5};

    // ---- CONSTRUCTOR ----
    // Throws std::invalid_argument for an unusable address or a non-positive timeout
    explicit ClientConfig(const std::string& server_url = DEFAULT_SERVER_URL,
                          std::chrono::milliseconds timeout = DEFAULT_TIMEOUT,
                          bool tls_strict = true);


    // ---- GETTERS ----
    const std::string& base_url() const { return base_url_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    bool tls_strict() const { return tls_strict_; }
    const ServerEndpoint& endpoint() const { return endpoint_; }


    // ---- ADDRESS HANDLING ----
    // Prefixes http:// unless the address already names http or https
    static std::string normalize_server_url(const std::string& url);
    // Splits a normalized address into its parts
    static ServerEndpoint parse_endpoint(const std::string& normalized_url);

private:
    std::string base_url_;
    std::chrono::milliseconds timeout_;
    bool tls_strict_;
    ServerEndpoint endpoint_;
};

} // namespace network
} // namespace backuper

#endif // BACKUPER_NETWORK_CLIENT_CONFIG_HPP
