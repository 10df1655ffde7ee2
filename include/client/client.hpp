#ifndef BACKUPER_CLIENT_CLIENT_HPP
#define BACKUPER_CLIENT_CLIENT_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include "client/operation_error.hpp"
#include "client/results.hpp"
#include "network/client_config.hpp"
#include "network/session.hpp"

namespace backuper {
namespace client {

// Runs archive operations against the backup server. Every operation
// performs exactly one HTTP exchange on a fresh session and drives the
// caller's io_context until that exchange is over. Failures are thrown
// as OperationError.
class Client {
public:
    // Server endpoints, relative to the base path of the server address
    static constexpr const char* SUBMIT_DATA = "/submit_data";
    static constexpr const char* RETRIEVE_DATA = "/retrieve_data";
    static constexpr const char* CHECK_DATA = "/check_data";
    static constexpr const char* LIST_DATA = "/list_data";
    static constexpr const char* REPAIR_DATA = "/repair_data";

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    Client(boost::asio::io_context& io_context, const network::ClientConfig& config);
    // Sessions come from session_factory instead of real HTTP connections
    Client(boost::asio::io_context& io_context, const network::ClientConfig& config,
           std::unique_ptr<network::SessionFactory> session_factory);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;


    // ---- ARCHIVE OPERATIONS ----
    // Uploads local_path under name
    SubmitOutcome submit(const std::string& name, const std::filesystem::path& local_path);
    // Downloads name into target_path, which must not exist yet
    void retrieve(const std::string& name, const std::filesystem::path& target_path);
    // Health of an archived file
    StatusReport check(const std::string& name);
    // All archived files
    FileListing list();
    // Asks the server to rebuild a damaged file from its parity shards
    RepairReport repair(const std::string& name);


    // ---- GETTERS ----
    const network::ClientConfig& config() const { return config_; }

private:
    // ---- PARAMETERS ----
    boost::asio::io_context& io_context_;
    network::ClientConfig config_;
    std::unique_ptr<network::SessionFactory> session_factory_;


    // ---- EXCHANGE ----
    // Performs one exchange on a new session, throws on transport failure
    network::Response exchange(network::Request request, network::BodySink& sink);
    // Builds the fault for a failed exchange
    OperationError transport_fault(const boost::system::error_code& ec) const;
    // Throws the fault matching a non-200 status
    [[noreturn]] void raise_for_status(const network::Response& response, const std::string& not_found_message) const;


    // ---- REQUEST HELPERS ----
    static std::string resource_target(const char* endpoint, const std::string& name);
    static std::string encode_path_segment(const std::string& segment);
    static void verify_regular_file(const std::filesystem::path& path);
    static bool is_not_found(unsigned status) { return status == 400 || status == 404; }
};

} // namespace client
} // namespace backuper

#endif // BACKUPER_CLIENT_CLIENT_HPP
