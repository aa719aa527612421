#include "utils/digest.hpp"
#include <iomanip>
#include <sstream>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace chunkvault::utils {

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

  EVP_MD_CTX* get() { return ctx; }
};

namespace {

std::string to_hex(const unsigned char* bytes, std::size_t length) {
  std::stringstream ss;
  for (std::size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Digest::Digest(Algorithm algorithm)
  : context_(std::make_unique<DigestContext>()) {
  const EVP_MD* md = algorithm == Algorithm::Sha1 ? EVP_sha1() : EVP_sha256();

  // Initialize the context with the selected algorithm
  if (!EVP_DigestInit_ex(context_->get(), md, nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}

Digest::~Digest() = default;


//==============================================
// HASHING
//==============================================

void Digest::update(const char* data, std::size_t length) {
  if (finished_) {
    throw DigestError("Update after digest was finalized");
  }
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update hash");
  }
}

std::string Digest::hex_digest() {
  if (finished_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }
  finished_ = true;

  return to_hex(hash, hash_len);
}

std::string Digest::hex(Algorithm algorithm, const std::string& data) {
  Digest digest(algorithm);
  digest.update(data);
  return digest.hex_digest();
}

std::string random_hex(std::size_t length) {
  std::vector<unsigned char> bytes(length);
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to generate random bytes";
    throw DigestError("Failed to generate random bytes");
  }
  return to_hex(bytes.data(), bytes.size());
}

} // namespace chunkvault::utils
