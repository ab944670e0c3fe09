#include "nodemesh/transfer/protocol.h"
#include <cstring>
#include <endian.h>
#include <arpa/inet.h>

namespace nodemesh {

namespace {

void append_u32(std::vector<uint8_t>& out, uint32_t value) {
    uint32_t be = htonl(value);
    const auto* p = reinterpret_cast<const uint8_t*>(&be);
    out.insert(out.end(), p, p + sizeof(be));
}

void append_u64(std::vector<uint8_t>& out, uint64_t value) {
    uint64_t be = htobe64(value);
    const auto* p = reinterpret_cast<const uint8_t*>(&be);
    out.insert(out.end(), p, p + sizeof(be));
}

void append_string(std::vector<uint8_t>& out, const std::string& value) {
    append_u32(out, static_cast<uint32_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

// Bounds-checked big-endian reader
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool read_u32(uint32_t& value) {
        if (size_ - pos_ < sizeof(uint32_t)) return false;
        uint32_t be;
        std::memcpy(&be, data_ + pos_, sizeof(be));
        value = ntohl(be);
        pos_ += sizeof(be);
        return true;
    }

    bool read_u64(uint64_t& value) {
        if (size_ - pos_ < sizeof(uint64_t)) return false;
        uint64_t be;
        std::memcpy(&be, data_ + pos_, sizeof(be));
        value = be64toh(be);
        pos_ += sizeof(be);
        return true;
    }

    bool read_string(std::string& value) {
        uint32_t len = 0;
        if (!read_u32(len)) return false;
        if (len > MAX_HEADER_FIELD_LENGTH || size_ - pos_ < len) return false;
        value.assign(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return true;
    }

    size_t position() const { return pos_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

} // anonymous namespace

std::string TransferHeader::range_key() const {
    return make_range_key(range_start, range_end);
}

std::vector<uint8_t> encode_header(const TransferHeader& header) {
    std::vector<uint8_t> out;
    out.reserve(HEADER_FIXED_SIZE + header.file_id.size() + header.file_name.size() +
                header.file_hash.size());

    append_string(out, header.file_id);
    append_string(out, header.file_name);
    append_u64(out, header.file_size);
    append_u64(out, header.range_start);
    append_u64(out, header.range_end);
    append_string(out, header.file_hash);
    return out;
}

std::optional<TransferHeader> decode_header(const uint8_t* data, size_t size, size_t* consumed) {
    if (data == nullptr) {
        return std::nullopt;
    }

    Reader reader(data, size);
    TransferHeader header;

    if (!reader.read_string(header.file_id) ||
        !reader.read_string(header.file_name) ||
        !reader.read_u64(header.file_size) ||
        !reader.read_u64(header.range_start) ||
        !reader.read_u64(header.range_end) ||
        !reader.read_string(header.file_hash)) {
        return std::nullopt;
    }

    if (consumed) {
        *consumed = reader.position();
    }
    return header;
}

bool validate_header(const TransferHeader& header) {
    if (header.file_id.empty()) return false;
    if (header.range_start >= header.range_end) return false;
    if (header.range_end > header.file_size) return false;
    return true;
}

std::string make_range_key(uint64_t start, uint64_t end) {
    return std::to_string(start) + "-" + std::to_string(end);
}

bool parse_range_key(const std::string& key, uint64_t& start, uint64_t& end) {
    auto dash = key.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 >= key.size()) {
        return false;
    }
    try {
        size_t idx = 0;
        start = std::stoull(key.substr(0, dash), &idx);
        if (idx != dash) return false;
        std::string tail = key.substr(dash + 1);
        end = std::stoull(tail, &idx);
        if (idx != tail.size()) return false;
    } catch (const std::exception&) {
        return false;
    }
    return start < end;
}

} // namespace nodemesh
