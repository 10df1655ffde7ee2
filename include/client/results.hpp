#ifndef BACKUPER_CLIENT_RESULTS_HPP
#define BACKUPER_CLIENT_RESULTS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace backuper {
namespace client {

struct SubmitOutcome {
    std::uint64_t total_size = 0;
    int data_shard_count = 0;
    int parity_shard_count = 0;
    std::vector<std::string> content_hashes;

    // Filled in locally, not part of the server reply
    std::string local_digest;
    std::filesystem::path source_path;
};

struct StatusReport {
    std::string name;
    std::string last_modified;
    std::string health;
    std::vector<std::string> content_hashes;
};

struct FileRecord {
    std::string name;
    std::string last_modified;
    std::string uuid;
    std::string sha256;
};

struct FileListing {
    std::vector<FileRecord> files;

    // The "no files" outcome
    bool empty() const { return files.empty(); }
};

struct RepairReport {
    static constexpr const char* STATUS_GOOD = "GOOD";

    std::string name;
    std::string status;

    bool is_good() const { return status == STATUS_GOOD; }
};

// ---- RESPONSE DECODING ----
// Each decoder throws a remote fault when the body is not the expected JSON
SubmitOutcome decode_submit_outcome(const std::string& body);
StatusReport decode_status_report(const std::string& body);
FileListing decode_file_listing(const std::string& body);
RepairReport decode_repair_report(const std::string& body);

} // namespace client
} // namespace backuper

#endif // BACKUPER_CLIENT_RESULTS_HPP
