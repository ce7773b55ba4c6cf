#ifndef GRIDSTORE_STORE_CHECKSUM_HPP
#define GRIDSTORE_STORE_CHECKSUM_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace gridstore {
namespace store {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental message digest over OpenSSL EVP
class Digest {
public:

  enum class Algorithm {
    Md5,
    Sha256
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Digest(Algorithm algorithm);
  ~Digest();

  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;


  // ---- DIGEST OPERATIONS ----
  // Feeds more data into the digest
  void update(const uint8_t* data, std::size_t size);
  void update(const std::string& data);
  // Finalizes the digest and returns it as lowercase hex, the digest cannot be updated afterwards
  std::string hex_digest();


  // ---- ONE-SHOT HELPERS ----
  static std::string md5_hex(const std::string& data);
  static std::string sha256_hex(const std::string& data);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

} // namespace store
} // namespace gridstore

#endif // GRIDSTORE_STORE_CHECKSUM_HPP
