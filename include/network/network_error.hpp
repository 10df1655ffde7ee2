#ifndef BACKUPER_NETWORK_ERROR_HPP
#define BACKUPER_NETWORK_ERROR_HPP

#include <string>
#include <type_traits>
#include <boost/system/error_code.hpp>

namespace backuper {
namespace network {

// Session failures that do not originate from the socket layer
enum class NetworkError {
    SUCCESS = 0,
    SINK_OPEN_FAILED,
    SINK_WRITE_FAILED,
    SOURCE_READ_FAILED,
    INCOMPLETE_EXCHANGE
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::SINK_OPEN_FAILED: return "Failed to open response destination";
        case NetworkError::SINK_WRITE_FAILED: return "Failed to write response body";
        case NetworkError::SOURCE_READ_FAILED: return "Failed to read request body";
        case NetworkError::INCOMPLETE_EXCHANGE: return "Exchange did not complete";
        default: return "Undefined error";
    }
}

class NetworkErrorCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "backuper.network"; }

    std::string message(int value) const override {
        return network_error_to_string(static_cast<NetworkError>(value));
    }
};

inline const boost::system::error_category& network_error_category() {
    static const NetworkErrorCategory category;
    return category;
}

inline boost::system::error_code make_error_code(NetworkError error) {
    return boost::system::error_code(static_cast<int>(error), network_error_category());
}

} // namespace network
} // namespace backuper

namespace boost {
namespace system {

template <>
struct is_error_code_enum<backuper::network::NetworkError> : std::true_type {};

} // namespace system
} // namespace boost

#endif // BACKUPER_NETWORK_ERROR_HPP
