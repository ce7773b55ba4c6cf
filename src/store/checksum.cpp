#include "store/checksum.hpp"
#include "store/backend.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace store {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw StoreError("Digest: Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Digest::Digest(Algorithm algorithm)
  : context_(std::make_unique<DigestContext>()) {
  const EVP_MD* md = (algorithm == Algorithm::Md5) ? EVP_md5() : EVP_sha256();
  if (!EVP_DigestInit_ex(context_->get(), md, nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to initialize digest context";
    throw StoreError("Digest: Failed to initialize digest context");
  }
}

Digest::~Digest() = default;


//==============================================
// DIGEST OPERATIONS
//==============================================

void Digest::update(const uint8_t* data, std::size_t size) {
  if (finalized_) {
    throw StoreError("Digest: Update after finalization");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to update digest with " << size << " bytes";
    throw StoreError("Digest: Failed to update digest");
  }
}

void Digest::update(const std::string& data) {
  update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string Digest::hex_digest() {
  if (finalized_) {
    throw StoreError("Digest: Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to finalize digest";
    throw StoreError("Digest: Failed to finalize digest");
  }
  finalized_ = true;

  // Convert the raw digest bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}


//==============================================
// ONE-SHOT HELPERS
//==============================================

std::string Digest::md5_hex(const std::string& data) {
  Digest digest(Algorithm::Md5);
  digest.update(data);
  return digest.hex_digest();
}

std::string Digest::sha256_hex(const std::string& data) {
  Digest digest(Algorithm::Sha256);
  digest.update(data);
  return digest.hex_digest();
}

} // namespace store
} // namespace gridstore
