#ifndef NODEMESH_DISCOVERY_DNS_MESSAGE_H
#define NODEMESH_DISCOVERY_DNS_MESSAGE_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace nodemesh {

// Record types used by multicast DNS service discovery
namespace dns_type {
constexpr uint16_t A = 1;
constexpr uint16_t PTR = 12;
constexpr uint16_t TXT = 16;
constexpr uint16_t AAAA = 28;
constexpr uint16_t SRV = 33;
constexpr uint16_t ANY = 255;
}

constexpr uint16_t DNS_CLASS_IN = 1;
constexpr uint16_t DNS_FLAG_RESPONSE = 0x8000;
constexpr uint16_t DNS_FLAG_AUTHORITATIVE = 0x0400;

struct DnsQuestion {
    std::string name;
    uint16_t type = dns_type::PTR;
    uint16_t qclass = DNS_CLASS_IN;
    bool unicast_response = false;
};

struct DnsRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rclass = DNS_CLASS_IN;
    bool cache_flush = false;
    uint32_t ttl = 0;

    // PTR and SRV target
    std::string target;

    // SRV
    uint16_t priority = 0;
    uint16_t weight = 0;
    uint16_t port = 0;

    // TXT strings, usually "key=value"
    std::vector<std::string> txt;

    // A and AAAA in text form
    std::string address;
};

struct DnsMessage {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authorities;
    std::vector<DnsRecord> additionals;

    bool is_response() const { return (flags & DNS_FLAG_RESPONSE) != 0; }
};

// Names are written uncompressed. Labels longer than 63 bytes are rejected.
std::optional<std::vector<uint8_t>> encode_dns_message(const DnsMessage& message);

// Decodes compressed names. Records of other types keep only their header fields.
std::optional<DnsMessage> decode_dns_message(const uint8_t* data, size_t size);

// Lowercase with a single trailing dot
std::string normalize_dns_name(const std::string& name);

// TXT strings to and from key/value properties
std::vector<std::string> make_txt_strings(const std::map<std::string, std::string>& properties);
std::map<std::string, std::string> parse_txt_strings(const std::vector<std::string>& strings);

} // namespace nodemesh

#endif // NODEMESH_DISCOVERY_DNS_MESSAGE_H
