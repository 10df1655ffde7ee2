#include "client/download_file.hpp"
#include <system_error>
#include <boost/log/trivial.hpp>
#include "client/operation_error.hpp"
#include "crypto/digest.hpp"

namespace backuper {
namespace client {

DownloadFile::DownloadFile(const std::filesystem::path& target)
  : target_(target)
  , temporary_(target.string() + "." + crypto::random_hex(TEMPORARY_TAG_BYTES) + TEMPORARY_SUFFIX) {
}

DownloadFile::~DownloadFile() {
  if (file_.is_open()) {
    file_.close();
  }
  if (opened_ && !committed_) {
    std::error_code ec;
    std::filesystem::remove(temporary_, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Download: Failed to remove partial file " << temporary_.string()
                                 << ": " << ec.message();
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Download: Removed partial file " << temporary_.string();
    }
  }
}

bool DownloadFile::open() {
  // Never truncate a file this download did not create
  std::error_code ec;
  if (std::filesystem::exists(temporary_, ec) || ec) {
    BOOST_LOG_TRIVIAL(debug) << "Download: Refusing to overwrite existing " << temporary_.string();
    return false;
  }

  file_.open(temporary_, std::ios::binary | std::ios::trunc);
  if (!file_) {
    BOOST_LOG_TRIVIAL(debug) << "Download: Failed to create " << temporary_.string();
    return false;
  }
  opened_ = true;
  BOOST_LOG_TRIVIAL(debug) << "Download: Writing to " << temporary_.string();
  return true;
}

bool DownloadFile::write(const char* data, std::size_t size) {
  file_.write(data, static_cast<std::streamsize>(size));
  if (!file_) {
    BOOST_LOG_TRIVIAL(debug) << "Download: Failed to write " << size << " bytes to " << temporary_.string();
    return false;
  }
  bytes_written_ += size;
  return true;
}

void DownloadFile::commit() {
  if (!opened_) {
    // A 200 reply always opens the file, even for an empty body
    throw caller_fault("Nothing was downloaded to " + target_.string());
  }

  file_.close();
  if (file_.fail()) {
    throw caller_fault("Failed to write " + temporary_.string());
  }

  if (std::filesystem::exists(target_)) {
    throw caller_fault(target_.string() + " already exists!");
  }

  std::error_code ec;
  std::filesystem::rename(temporary_, target_, ec);
  if (ec) {
    throw caller_fault("Failed to move download to " + target_.string() + ": " + ec.message());
  }

  committed_ = true;
  BOOST_LOG_TRIVIAL(info) << "Download: Saved " << bytes_written_ << " bytes to " << target_.string();
}

} // namespace client
} // namespace backuper
