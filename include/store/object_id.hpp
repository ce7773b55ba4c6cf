#ifndef GRIDSTORE_STORE_OBJECT_ID_HPP
#define GRIDSTORE_STORE_OBJECT_ID_HPP

#include <string>

namespace gridstore {
namespace store {

// Generates a new file id: 4 bytes of big-endian seconds since the epoch
// followed by 8 random bytes, rendered as 24 lowercase hex digits
std::string generate_object_id();

// True if id has the shape produced by generate_object_id
bool is_object_id(const std::string& id);

} // namespace store
} // namespace gridstore

#endif // GRIDSTORE_STORE_OBJECT_ID_HPP
