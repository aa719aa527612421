#ifndef CHUNKVAULT_UTILS_DIGEST_HPP
#define CHUNKVAULT_UTILS_DIGEST_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <stdexcept>

namespace chunkvault::utils {

// Forward declaration for OpenSSL digest context
struct DigestContext;

class DigestError : public std::runtime_error {
public:
  explicit DigestError(const std::string& message)
    : std::runtime_error("Digest error: " + message) {}
};

// Incremental message digest over OpenSSL EVP
class Digest {
public:
  enum class Algorithm {
    Sha1,
    Sha256
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Digest(Algorithm algorithm);
  ~Digest();

  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;


  // ---- HASHING ----
  void update(const char* data, std::size_t length);
  void update(const std::string& data) { update(data.data(), data.size()); }
  // Finishes the digest and returns it as lowercase hex. The object can not be updated afterwards.
  std::string hex_digest();

  // One-shot helper
  static std::string hex(Algorithm algorithm, const std::string& data);

private:
  std::unique_ptr<DigestContext> context_;
  bool finished_ = false;
};

// Lowercase hex of length random bytes from the OpenSSL CSPRNG
std::string random_hex(std::size_t length);

} // namespace chunkvault::utils

#endif // CHUNKVAULT_UTILS_DIGEST_HPP
