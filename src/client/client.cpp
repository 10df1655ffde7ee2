#include "client/client.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <boost/beast/core/error.hpp>
#include <boost/log/trivial.hpp>
#include "client/download_file.hpp"
#include "crypto/digest.hpp"
#include "network/http_session.hpp"
#include "network/network_error.hpp"

namespace backuper {
namespace client {

namespace http = boost::beast::http;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Client::Client(boost::asio::io_context& io_context, const network::ClientConfig& config)
  : Client(io_context, config, std::make_unique<network::HttpSessionFactory>(io_context, config)) {
}

Client::Client(boost::asio::io_context& io_context, const network::ClientConfig& config,
               std::unique_ptr<network::SessionFactory> session_factory)
  : io_context_(io_context)
  , config_(config)
  , session_factory_(std::move(session_factory)) {
  BOOST_LOG_TRIVIAL(debug) << "Client: Initialized for " << config_.base_url();
}

Client::~Client() = default;


//==============================================
// ARCHIVE OPERATIONS
//==============================================

SubmitOutcome Client::submit(const std::string& name, const std::filesystem::path& local_path) {
  BOOST_LOG_TRIVIAL(info) << "Client: Submitting " << local_path.string() << " as " << name;

  verify_regular_file(local_path);

  std::ifstream file(local_path, std::ios::binary);
  if (!file) {
    throw caller_fault("Failed to open " + local_path.string());
  }

  std::string digest;
  std::uintmax_t file_size = 0;
  try {
    digest = crypto::Digest::sha256_hex(file);
    file_size = std::filesystem::file_size(local_path);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Client: Failed to hash " << local_path.string() << ": " << e.what();
    throw caller_fault("Failed to hash " + local_path.string() + ": " + e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    throw caller_fault("Failed to read " + local_path.string() + ": " + e.what());
  }
  BOOST_LOG_TRIVIAL(info) << "Client: sha256 of " << local_path.string() << " is " << digest;

  network::Request request;
  request.method = http::verb::post;
  request.target = SUBMIT_DATA;
  request.body = std::make_shared<network::MultipartFileBody>(
    "filename", name, "file", local_path.filename().string(), file, file_size);

  network::StringSink sink;
  network::Response response = exchange(std::move(request), sink);
  if (response.status != 200) {
    raise_for_status(response, "");
  }

  SubmitOutcome outcome = decode_submit_outcome(sink.str());
  outcome.local_digest = digest;
  outcome.source_path = local_path;

  BOOST_LOG_TRIVIAL(info) << "Client: Submitted " << name << " (" << outcome.total_size << " bytes, "
                          << outcome.data_shard_count << " data + " << outcome.parity_shard_count
                          << " parity shards)";
  return outcome;
}

void Client::retrieve(const std::string& name, const std::filesystem::path& target_path) {
  BOOST_LOG_TRIVIAL(info) << "Client: Retrieving " << name << " into " << target_path.string();

  if (std::filesystem::exists(target_path)) {
    throw caller_fault(target_path.string() + " already exists!");
  }

  DownloadFile download(target_path);
  network::Request request;
  request.target = resource_target(RETRIEVE_DATA, name);

  network::Response response = exchange(std::move(request), download);
  if (response.status != 200) {
    // Not-found replies carry the server's own explanation
    raise_for_status(response, "");
  }

  download.commit();
}

StatusReport Client::check(const std::string& name) {
  BOOST_LOG_TRIVIAL(info) << "Client: Checking " << name;

  network::Request request;
  request.target = resource_target(CHECK_DATA, name);

  network::StringSink sink;
  network::Response response = exchange(std::move(request), sink);
  if (response.status != 200) {
    raise_for_status(response, "File " + name + " not found!");
  }

  return decode_status_report(sink.str());
}

FileListing Client::list() {
  BOOST_LOG_TRIVIAL(info) << "Client: Listing archived files";

  network::Request request;
  request.target = LIST_DATA;

  network::StringSink sink;
  network::Response response = exchange(std::move(request), sink);
  if (response.status != 200) {
    throw remote_fault(response.body, response.status, response.body);
  }

  FileListing listing = decode_file_listing(sink.str());
  BOOST_LOG_TRIVIAL(debug) << "Client: Server lists " << listing.files.size() << " file(s)";
  return listing;
}

RepairReport Client::repair(const std::string& name) {
  BOOST_LOG_TRIVIAL(info) << "Client: Repairing " << name;

  network::Request request;
  request.target = resource_target(REPAIR_DATA, name);

  network::StringSink sink;
  network::Response response = exchange(std::move(request), sink);
  if (response.status != 200) {
    raise_for_status(response, "File " + name + " not found!");
  }

  RepairReport report = decode_repair_report(sink.str());
  if (!report.is_good()) {
    BOOST_LOG_TRIVIAL(info) << "Client: Repair of " << name << " reported: " << report.status;
  }
  return report;
}


//==============================================
// EXCHANGE
//==============================================

network::Response Client::exchange(network::Request request, network::BodySink& sink) {
  std::shared_ptr<network::Session> session = session_factory_->create_session();

  boost::system::error_code result_ec = network::NetworkError::INCOMPLETE_EXCHANGE;
  network::Response result;
  bool finished = false;
  session->async_exchange(std::move(request), sink,
    [&result_ec, &result, &finished](const boost::system::error_code& ec, network::Response response) {
      result_ec = ec;
      result = std::move(response);
      finished = true;
    });
  // The session keeps itself alive through its pending handlers
  session.reset();

  // A cancelled name lookup keeps the context busy until it returns,
  // so stop as soon as the exchange has an outcome
  io_context_.restart();
  while (!finished && io_context_.run_one()) {
  }
  // Release handlers that were aborted by the completion
  io_context_.poll();

  if (result_ec) {
    throw transport_fault(result_ec);
  }

  BOOST_LOG_TRIVIAL(debug) << "Client: Exchange finished with status " << result.status;
  return result;
}

OperationError Client::transport_fault(const boost::system::error_code& ec) const {
  if (ec == boost::beast::error::timeout) {
    return remote_fault("Request to " + config_.base_url() + " timed out after " +
                        std::to_string(config_.timeout().count()) + " ms");
  }
  // Local file problems while streaming are the caller's, not the server's
  if (ec == network::NetworkError::SINK_OPEN_FAILED ||
      ec == network::NetworkError::SINK_WRITE_FAILED ||
      ec == network::NetworkError::SOURCE_READ_FAILED) {
    return caller_fault(ec.message());
  }
  return remote_fault("Request to " + config_.base_url() + " failed: " + ec.message());
}

void Client::raise_for_status(const network::Response& response, const std::string& not_found_message) const {
  BOOST_LOG_TRIVIAL(info) << "Client: Server replied " << response.status << ": " << response.body;

  if (is_not_found(response.status)) {
    const std::string& message = not_found_message.empty() ? response.body : not_found_message;
    throw caller_fault(message, response.status, response.body);
  }
  throw remote_fault(response.body, response.status, response.body);
}


//==============================================
// REQUEST HELPERS
//==============================================

std::string Client::resource_target(const char* endpoint, const std::string& name) {
  return std::string(endpoint) + "/" + encode_path_segment(name);
}

// Percent-encodes everything outside the RFC 3986 unreserved set
std::string Client::encode_path_segment(const std::string& segment) {
  std::ostringstream encoded;
  encoded << std::uppercase << std::hex << std::setfill('0');
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded << c;
    } else {
      encoded << '%' << std::setw(2) << static_cast<int>(c);
    }
  }
  return encoded.str();
}

void Client::verify_regular_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw caller_fault(path.string() + " does not exist!");
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw caller_fault(path.string() + " is not a file!");
  }
}

} // namespace client
} // namespace backuper
