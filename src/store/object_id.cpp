#include "store/object_id.hpp"
#include "store/backend.hpp"
#include <array>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <openssl/rand.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace gridstore {
namespace store {

namespace {
constexpr std::size_t TIMESTAMP_SIZE = 4;
constexpr std::size_t RANDOM_SIZE = 8;
constexpr std::size_t ID_SIZE = TIMESTAMP_SIZE + RANDOM_SIZE;
}

std::string generate_object_id() {
  std::array<uint8_t, ID_SIZE> raw{};

  // Leading timestamp keeps ids roughly ordered by creation time
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  uint32_t network_seconds = boost::endian::native_to_big(static_cast<uint32_t>(seconds));
  std::memcpy(raw.data(), &network_seconds, TIMESTAMP_SIZE);

  if (RAND_bytes(raw.data() + TIMESTAMP_SIZE, static_cast<int>(RANDOM_SIZE)) != 1) {
    BOOST_LOG_TRIVIAL(error) << "ObjectId: Failed to generate random bytes";
    throw StoreError("ObjectId: Failed to generate random bytes");
  }

  std::stringstream ss;
  for (uint8_t byte : raw) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

bool is_object_id(const std::string& id) {
  if (id.size() != ID_SIZE * 2) {
    return false;
  }
  for (char c : id) {
    bool digit = (c >= '0' && c <= '9');
    bool lower_hex = (c >= 'a' && c <= 'f');
    if (!digit && !lower_hex) {
      return false;
    }
  }
  return true;
}

} // namespace store
} // namespace gridstore
