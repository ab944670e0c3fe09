#ifndef NODEMESH_TRANSFER_PROTOCOL_H
#define NODEMESH_TRANSFER_PROTOCOL_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace nodemesh {

// Header that opens every transfer connection. All integers big-endian:
//   u32 id_len | file_id | u32 name_len | file_name | u64 file_size |
//   u64 range_start | u64 range_end | u32 hash_len | file_hash
// followed by range_end - range_start raw payload bytes.
struct TransferHeader {
    std::string file_id;
    std::string file_name;
    uint64_t file_size = 0;
    uint64_t range_start = 0;   // Inclusive
    uint64_t range_end = 0;     // Exclusive
    std::string file_hash;      // Hex SHA-256 of the whole file

    uint64_t range_length() const { return range_end - range_start; }
    std::string range_key() const;

    bool operator==(const TransferHeader& other) const = default;
};

// Upper bound on a single string field, so a corrupt length cannot force a huge read
constexpr uint32_t MAX_HEADER_FIELD_LENGTH = 4096;

// Size of the fixed integer part of the header
constexpr size_t HEADER_FIXED_SIZE = 4 + 4 + 8 + 8 + 8 + 4;

// One byte the receiver writes back once a range has landed
enum class RangeAck : uint8_t {
    Ok = 0,
    Failed = 1,
    HashMismatch = 2
};

std::vector<uint8_t> encode_header(const TransferHeader& header);

// Decode from the front of a buffer. Returns std::nullopt if the buffer ends
// before the header does or a length field exceeds MAX_HEADER_FIELD_LENGTH.
// On success *consumed receives the header size.
std::optional<TransferHeader> decode_header(const uint8_t* data, size_t size, size_t* consumed = nullptr);

inline std::optional<TransferHeader> decode_header(const std::vector<uint8_t>& data, size_t* consumed = nullptr) {
    return decode_header(data.data(), data.size(), consumed);
}

// Range is inside the file and non-empty
bool validate_header(const TransferHeader& header);

// Range key in the side record, "{start}-{end}"
std::string make_range_key(uint64_t start, uint64_t end);
bool parse_range_key(const std::string& key, uint64_t& start, uint64_t& end);

} // namespace nodemesh

#endif // NODEMESH_TRANSFER_PROTOCOL_H
