#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace backuper::crypto {

namespace {

std::string to_hex(const unsigned char* data, size_t size) {
  std::stringstream ss;
  for (size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}

Sha256::~Sha256() = default;


//==============================================
// HASHING
//==============================================

void Sha256::update(const char* data, size_t size) {
  if (finalized_) {
    throw DigestError("Hash already finalized");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Failed to update hash");
  }
}

std::string Sha256::hex_digest() {
  if (finalized_) {
    throw DigestError("Hash already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }
  finalized_ = true;

  return to_hex(hash, hash_len);
}

std::string Digest::sha256_hex(std::istream& input) {
  BOOST_LOG_TRIVIAL(debug) << "Digest: Hashing input stream";

  // Remember where the caller left the stream so it can be reused afterwards
  input.clear();
  const std::streampos saved_position = input.tellg();
  if (saved_position == std::streampos(-1) || !input.seekg(0)) {
    throw DigestError("Input stream is not seekable");
  }

  Sha256 hasher;
  std::vector<char> buffer(BLOCK_SIZE);
  std::uintmax_t total_bytes = 0;

  // A short read sets eof/fail, gcount() still reports the bytes of the final block
  while (true) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize bytes_read = input.gcount();
    if (bytes_read > 0) {
      hasher.update(buffer.data(), static_cast<size_t>(bytes_read));
      total_bytes += static_cast<std::uintmax_t>(bytes_read);
    }
    if (input.bad()) {
      throw DigestError("Failed to read input stream");
    }
    if (bytes_read == 0 || !input) {
      break;
    }
  }

  input.clear();
  if (!input.seekg(saved_position)) {
    throw DigestError("Failed to restore input stream position");
  }

  std::string result = hasher.hex_digest();
  BOOST_LOG_TRIVIAL(debug) << "Digest: Hashed " << total_bytes << " bytes: " << result;
  return result;
}

std::string Digest::sha256_hex(const std::string& data) {
  Sha256 hasher;
  hasher.update(data.data(), data.size());
  return hasher.hex_digest();
}

std::string random_hex(size_t count) {
  std::vector<unsigned char> bytes(count);
  if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw RandomError("Failed to generate random bytes");
  }
  return to_hex(bytes.data(), bytes.size());
}

} // namespace backuper::crypto
