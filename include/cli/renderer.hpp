#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "client/operation_error.hpp"
#include "client/results.hpp"

namespace backuper {
namespace cli {

class Renderer {
public:
  // ---- CONSTRUCTOR ----
  explicit Renderer(std::ostream& out);


  // ---- OPERATION RESULTS ----
  void render(const client::SubmitOutcome& outcome);
  void render_retrieved(const std::string& name, const std::filesystem::path& target_path);
  void render(const client::StatusReport& report);
  // Prints "No files!" for an empty listing
  void render(const client::FileListing& listing);
  void render(const client::RepairReport& report);


  // ---- FAULTS ----
  void render_error(const client::OperationError& error);

private:
  std::ostream& out_;

  void separator();
  static std::string join_hashes(const std::vector<std::string>& hashes);
};

} // namespace cli
} // namespace backuper
