#include "client/results.hpp"
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>
#include "client/operation_error.hpp"

namespace backuper {
namespace client {

using json = nlohmann::json;

namespace {

json parse_body(const std::string& body, const char* what) {
  try {
    json document = json::parse(body);
    if (!document.is_object()) {
      throw remote_fault(std::string("Malformed ") + what + " response: expected a JSON object", 200, body);
    }
    return document;
  } catch (const json::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Results: Failed to parse " << what << " response: " << e.what();
    throw remote_fault(std::string("Malformed ") + what + " response: " + e.what(), 200, body);
  }
}

// Go encodes an empty slice as null, both mean "no entries"
std::vector<std::string> string_list(const json& document, const char* key) {
  const auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return {};
  }
  return it->get<std::vector<std::string>>();
}

std::string optional_string(const json& document, const char* key) {
  const auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return "";
  }
  return it->get<std::string>();
}

std::string health_text(const json& health) {
  if (health.is_boolean()) {
    return health.get<bool>() ? "GOOD" : "DAMAGED";
  }
  return health.get<std::string>();
}

template <typename Decoder>
auto decode(const std::string& body, const char* what, Decoder decoder) {
  json document = parse_body(body, what);
  try {
    return decoder(document);
  } catch (const json::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Results: Unexpected " << what << " response: " << e.what();
    throw remote_fault(std::string("Malformed ") + what + " response: " + e.what(), 200, body);
  }
}

} // namespace

SubmitOutcome decode_submit_outcome(const std::string& body) {
  return decode(body, "submit", [](const json& document) {
    SubmitOutcome outcome;
    outcome.total_size = document.at("size").get<std::uint64_t>();
    outcome.data_shard_count = document.at("data_shards").get<int>();
    outcome.parity_shard_count = document.at("parity_shards").get<int>();
    outcome.content_hashes = string_list(document, "hashes");
    return outcome;
  });
}

StatusReport decode_status_report(const std::string& body) {
  return decode(body, "check", [](const json& document) {
    StatusReport report;
    report.name = document.at("name").get<std::string>();
    report.last_modified = optional_string(document, "lmod");
    report.health = health_text(document.at("health"));
    report.content_hashes = string_list(document, "hashes");
    return report;
  });
}

FileListing decode_file_listing(const std::string& body) {
  return decode(body, "list", [](const json& document) {
    FileListing listing;
    const json& files = document.at("files");
    if (files.is_null()) {
      return listing;
    }
    for (const json& entry : files) {
      FileRecord record;
      // Older servers list bare names
      if (entry.is_string()) {
        record.name = entry.get<std::string>();
        listing.files.push_back(std::move(record));
        continue;
      }
      record.name = entry.at("name").get<std::string>();
      record.last_modified = optional_string(entry, "lmod");
      record.uuid = optional_string(entry, "uuid");
      record.sha256 = optional_string(entry, "sha256");
      listing.files.push_back(std::move(record));
    }
    return listing;
  });
}

RepairReport decode_repair_report(const std::string& body) {
  return decode(body, "repair", [](const json& document) {
    RepairReport report;
    report.name = document.at("name").get<std::string>();
    report.status = document.at("status").get<std::string>();
    return report;
  });
}

} // namespace client
} // namespace backuper
