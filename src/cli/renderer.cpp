#include "cli/renderer.hpp"

namespace backuper {
namespace cli {

namespace {
constexpr std::size_t SEPARATOR_WIDTH = 80;
}

Renderer::Renderer(std::ostream& out) : out_(out) {}


//==============================================
// OPERATION RESULTS
//==============================================

void Renderer::render(const client::SubmitOutcome& outcome) {
  separator();
  out_ << "Uploaded file: " << outcome.source_path.string() << '\n';
  out_ << "sha256: " << outcome.local_digest << '\n';
  separator();
  out_ << "Status: SUCCESS" << '\n';
  out_ << "size: " << outcome.total_size << '\n';
  out_ << "data_shards: " << outcome.data_shard_count << '\n';
  out_ << "parity_shards: " << outcome.parity_shard_count << '\n';
  out_ << "hashes: " << join_hashes(outcome.content_hashes) << '\n';
}

void Renderer::render_retrieved(const std::string& name, const std::filesystem::path& target_path) {
  out_ << "Downloaded \"" << name << "\" to \"" << target_path.string() << "\"" << '\n';
}

void Renderer::render(const client::StatusReport& report) {
  separator();
  out_ << "name: " << report.name << '\n';
  out_ << "last modified: " << report.last_modified << '\n';
  out_ << "health: " << report.health << '\n';
  out_ << "hashes: " << join_hashes(report.content_hashes) << '\n';
}

void Renderer::render(const client::FileListing& listing) {
  if (listing.empty()) {
    out_ << "No files!" << '\n';
    return;
  }

  for (const auto& record : listing.files) {
    separator();
    out_ << "name: " << record.name << '\n';
    out_ << "last modified: " << record.last_modified << '\n';
    out_ << "uuid: " << record.uuid << '\n';
    out_ << "sha256sum: " << record.sha256 << '\n';
  }
}

void Renderer::render(const client::RepairReport& report) {
  separator();
  out_ << "name: " << report.name << '\n';
  out_ << "status: " << report.status << '\n';
}


//==============================================
// FAULTS
//==============================================

void Renderer::render_error(const client::OperationError& error) {
  out_ << (error.is_caller_fault() ? "Client error: " : "Server error: ") << error.what() << '\n';
}

void Renderer::separator() {
  out_ << std::string(SEPARATOR_WIDTH, '=') << '\n';
}

std::string Renderer::join_hashes(const std::vector<std::string>& hashes) {
  std::string joined = "[";
  for (std::size_t i = 0; i < hashes.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += hashes[i];
  }
  return joined + "]";
}

} // namespace cli
} // namespace backuper
