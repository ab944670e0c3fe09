#ifndef NODEMESH_BASE_UUID_H
#define NODEMESH_BASE_UUID_H

#include <string>

namespace nodemesh {

// New random UUID in lowercase canonical form (libuuid)
std::string generate_uuid();

// True if the string parses as a UUID
bool is_valid_uuid(const std::string& value);

} // namespace nodemesh

#endif // NODEMESH_BASE_UUID_H
