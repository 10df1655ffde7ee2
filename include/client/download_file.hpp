#ifndef BACKUPER_CLIENT_DOWNLOAD_FILE_HPP
#define BACKUPER_CLIENT_DOWNLOAD_FILE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include "network/message_body.hpp"

namespace backuper {
namespace client {

// Writes a downloaded body next to its destination, under a name with a
// random tag, and moves it into place only once commit() is called. An uncommitted download is
// removed when the object goes away, so a failed transfer never leaves
// a truncated file behind.
class DownloadFile : public network::BodySink {
public:
    static constexpr const char* TEMPORARY_SUFFIX = ".backuper-part";
    static constexpr std::size_t TEMPORARY_TAG_BYTES = 8;

    explicit DownloadFile(const std::filesystem::path& target);
    ~DownloadFile() override;

    DownloadFile(const DownloadFile&) = delete;
    DownloadFile& operator=(const DownloadFile&) = delete;

    // Fails when the temporary path already exists
    bool open() override;
    bool write(const char* data, std::size_t size) override;

    // Renames the temporary file onto the target, throws a caller fault on failure
    void commit();

    const std::filesystem::path& target_path() const { return target_; }
    const std::filesystem::path& temporary_path() const { return temporary_; }
    std::uint64_t bytes_written() const { return bytes_written_; }

private:
    std::filesystem::path target_;
    std::filesystem::path temporary_;
    std::ofstream file_;
    std::uint64_t bytes_written_ = 0;
    bool opened_ = false;
    bool committed_ = false;
};

} // namespace client
} // namespace backuper

#endif // BACKUPER_CLIENT_DOWNLOAD_FILE_HPP
