#include "network/message_body.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "crypto/digest.hpp"

namespace backuper {
namespace network {

//==============================================
// CONSTRUCTOR
//==============================================

MultipartFileBody::MultipartFileBody(const std::string& field_name, const std::string& field_value,
                                     const std::string& file_field_name, const std::string& file_name,
                                     std::istream& file, std::uint64_t file_size,
                                     const std::string& boundary)
  : boundary_(boundary)
  , file_(file)
  , file_size_(file_size) {

  prefix_ = "--" + boundary_ + "\r\n"
            "Content-Disposition: form-data; name=" + quote_parameter(field_name) + "\r\n"
            "\r\n" +
            field_value + "\r\n"
            "--" + boundary_ + "\r\n"
            "Content-Disposition: form-data; name=" + quote_parameter(file_field_name) +
            "; filename=" + quote_parameter(file_name) + "\r\n"
            "Content-Type: application/octet-stream\r\n"
            "\r\n";
  suffix_ = "\r\n--" + boundary_ + "--\r\n";

  BOOST_LOG_TRIVIAL(debug) << "Multipart body: Prepared " << size() << " bytes with boundary " << boundary_;
}

std::string MultipartFileBody::generate_boundary() {
  return "backuper-" + crypto::random_hex(16);
}


//==============================================
// BODY SOURCE
//==============================================

std::string MultipartFileBody::content_type() const {
  return "multipart/form-data; boundary=" + boundary_;
}

std::uint64_t MultipartFileBody::size() const {
  return prefix_.size() + file_size_ + suffix_.size();
}

std::size_t MultipartFileBody::read(char* buffer, std::size_t capacity) {
  if (failed_ || capacity == 0) {
    return 0;
  }

  std::size_t produced = copy_part(prefix_, prefix_sent_, buffer, capacity);

  // File content, never more than the size announced in Content-Length
  if (produced < capacity && prefix_sent_ == prefix_.size() && file_sent_ < file_size_) {
    const std::uint64_t wanted = std::min<std::uint64_t>(capacity - produced, file_size_ - file_sent_);
    file_.read(buffer + produced, static_cast<std::streamsize>(wanted));
    const std::streamsize got = file_.gcount();
    if (got <= 0 || file_.bad()) {
      BOOST_LOG_TRIVIAL(debug) << "Multipart body: File ended after " << file_sent_
                               << " of " << file_size_ << " bytes";
      failed_ = true;
      return 0;
    }
    file_sent_ += static_cast<std::uint64_t>(got);
    produced += static_cast<std::size_t>(got);
    if (file_sent_ < file_size_) {
      return produced;
    }
  }

  if (produced < capacity && file_sent_ == file_size_) {
    produced += copy_part(suffix_, suffix_sent_, buffer + produced, capacity - produced);
  }
  return produced;
}

std::size_t MultipartFileBody::copy_part(const std::string& part, std::size_t& sent,
                                         char* buffer, std::size_t capacity) {
  const std::size_t count = std::min(capacity, part.size() - sent);
  std::copy_n(part.data() + sent, count, buffer);
  sent += count;
  return count;
}

// Quotes a Content-Disposition parameter, escaping the characters that would end it
std::string MultipartFileBody::quote_parameter(const std::string& value) {
  std::string quoted = "\"";
  for (char c : value) {
    switch (c) {
      case '"':  quoted += "%22"; break;
      case '\r': quoted += "%0D"; break;
      case '\n': quoted += "%0A"; break;
      default:   quoted += c;
    }
  }
  quoted += "\"";
  return quoted;
}

} // namespace network
} // namespace backuper
