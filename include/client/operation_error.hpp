#ifndef BACKUPER_CLIENT_OPERATION_ERROR_HPP
#define BACKUPER_CLIENT_OPERATION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace backuper {
namespace client {

enum class ErrorKind {
    caller_fault,   // bad local input or a server-declared "not found"
    remote_fault    // any other failure of the exchange
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::caller_fault: return "caller fault";
        case ErrorKind::remote_fault: return "remote fault";
        default: return "unknown fault";
    }
}

class OperationError : public std::runtime_error {
public:
    OperationError(ErrorKind kind, const std::string& message,
                   unsigned status = 0, const std::string& response_body = "")
        : std::runtime_error(message)
        , kind_(kind)
        , status_(status)
        , response_body_(response_body) {}

    ErrorKind kind() const noexcept { return kind_; }
    bool is_caller_fault() const noexcept { return kind_ == ErrorKind::caller_fault; }
    // HTTP status that produced the fault, 0 when no response was received
    unsigned status() const noexcept { return status_; }
    // Raw body of the failed response, empty when there was none
    const std::string& response_body() const noexcept { return response_body_; }

private:
    ErrorKind kind_;
    unsigned status_;
    std::string response_body_;
};

inline OperationError caller_fault(const std::string& message, unsigned status = 0,
                                   const std::string& response_body = "") {
    return OperationError(ErrorKind::caller_fault, message, status, response_body);
}

inline OperationError remote_fault(const std::string& message, unsigned status = 0,
                                   const std::string& response_body = "") {
    return OperationError(ErrorKind::remote_fault, message, status, response_body);
}

} // namespace client
} // namespace backuper

#endif // BACKUPER_CLIENT_OPERATION_ERROR_HPP
