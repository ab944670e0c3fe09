#include "nodemesh/discovery/dns_message.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace nodemesh {

namespace {

constexpr size_t MAX_LABEL_LENGTH = 63;
constexpr size_t MAX_NAME_LENGTH = 255;
constexpr int MAX_POINTER_JUMPS = 16;
constexpr uint16_t CLASS_MASK = 0x7fff;
constexpr uint16_t TOP_BIT = 0x8000;

class Writer {
public:
    void u8(uint8_t v) { out_.push_back(v); }

    void u16(uint16_t v) {
        out_.push_back(static_cast<uint8_t>(v >> 8));
        out_.push_back(static_cast<uint8_t>(v & 0xff));
    }

    void u32(uint32_t v) {
        u16(static_cast<uint16_t>(v >> 16));
        u16(static_cast<uint16_t>(v & 0xffff));
    }

    void bytes(const void* data, size_t n) {
        const auto* p = static_cast<const uint8_t*>(data);
        out_.insert(out_.end(), p, p + n);
    }

    bool name(const std::string& value) {
        size_t start = 0;
        size_t total = 0;
        while (start < value.size()) {
            size_t dot = value.find('.', start);
            size_t end = dot == std::string::npos ? value.size() : dot;
            size_t len = end - start;
            if (len == 0 || len > MAX_LABEL_LENGTH) {
                return false;
            }
            total += len + 1;
            u8(static_cast<uint8_t>(len));
            bytes(value.data() + start, len);
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        u8(0);
        return total + 1 <= MAX_NAME_LENGTH;
    }

    size_t size() const { return out_.size(); }

    void patch_u16(size_t offset, uint16_t v) {
        out_[offset] = static_cast<uint8_t>(v >> 8);
        out_[offset + 1] = static_cast<uint8_t>(v & 0xff);
    }

    std::vector<uint8_t> take() { return std::move(out_); }

private:
    std::vector<uint8_t> out_;
};

class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool u8(uint8_t& v) {
        if (pos_ + 1 > size_) return false;
        v = data_[pos_++];
        return true;
    }

    bool u16(uint16_t& v) {
        if (pos_ + 2 > size_) return false;
        v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    bool u32(uint32_t& v) {
        uint16_t hi = 0;
        uint16_t lo = 0;
        if (!u16(hi) || !u16(lo)) return false;
        v = (static_cast<uint32_t>(hi) << 16) | lo;
        return true;
    }

    // Reads a possibly compressed name starting at the cursor
    bool name(std::string& out) {
        out.clear();
        size_t cursor = pos_;
        bool jumped = false;
        int jumps = 0;

        while (true) {
            if (cursor >= size_) return false;
            uint8_t len = data_[cursor];

            if ((len & 0xc0) == 0xc0) {
                if (cursor + 1 >= size_ || ++jumps > MAX_POINTER_JUMPS) return false;
                size_t target = (static_cast<size_t>(len & 0x3f) << 8) | data_[cursor + 1];
                if (!jumped) {
                    pos_ = cursor + 2;
                    jumped = true;
                }
                cursor = target;
                continue;
            }
            if ((len & 0xc0) != 0) {
                return false;
            }

            ++cursor;
            if (len == 0) break;
            if (cursor + len > size_) return false;
            out.append(reinterpret_cast<const char*>(data_ + cursor), len);
            out.push_back('.');
            if (out.size() > MAX_NAME_LENGTH) return false;
            cursor += len;
        }

        if (!jumped) {
            pos_ = cursor;
        }
        if (out.empty()) {
            out = ".";
        }
        return true;
    }

    bool skip(size_t n) {
        if (pos_ + n > size_) return false;
        pos_ += n;
        return true;
    }

    size_t position() const { return pos_; }
    const uint8_t* at(size_t offset) const { return data_ + offset; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

bool write_record(Writer& w, const DnsRecord& r) {
    if (!w.name(r.name)) return false;
    w.u16(r.type);
    w.u16(static_cast<uint16_t>((r.rclass & CLASS_MASK) | (r.cache_flush ? TOP_BIT : 0)));
    w.u32(r.ttl);

    size_t rdlength_offset = w.size();
    w.u16(0);
    size_t rdata_start = w.size();

    switch (r.type) {
        case dns_type::PTR:
            if (!w.name(r.target)) return false;
            break;
        case dns_type::SRV:
            w.u16(r.priority);
            w.u16(r.weight);
            w.u16(r.port);
            if (!w.name(r.target)) return false;
            break;
        case dns_type::TXT:
            if (r.txt.empty()) {
                w.u8(0);
            }
            for (const auto& s : r.txt) {
                if (s.size() > 255) return false;
                w.u8(static_cast<uint8_t>(s.size()));
                w.bytes(s.data(), s.size());
            }
            break;
        case dns_type::A: {
            in_addr addr{};
            if (inet_pton(AF_INET, r.address.c_str(), &addr) != 1) return false;
            w.bytes(&addr, sizeof(addr));
            break;
        }
        case dns_type::AAAA: {
            in6_addr addr{};
            if (inet_pton(AF_INET6, r.address.c_str(), &addr) != 1) return false;
            w.bytes(&addr, sizeof(addr));
            break;
        }
        default:
            return false;
    }

    w.patch_u16(rdlength_offset, static_cast<uint16_t>(w.size() - rdata_start));
    return true;
}

bool read_record(Reader& r, DnsRecord& rec) {
    uint16_t rclass = 0;
    uint16_t rdlength = 0;
    if (!r.name(rec.name) || !r.u16(rec.type) || !r.u16(rclass) || !r.u32(rec.ttl) || !r.u16(rdlength)) {
        return false;
    }
    rec.rclass = rclass & CLASS_MASK;
    rec.cache_flush = (rclass & TOP_BIT) != 0;

    size_t rdata_start = r.position();
    size_t rdata_end = rdata_start + rdlength;

    switch (rec.type) {
        case dns_type::PTR:
            if (!r.name(rec.target)) return false;
            break;
        case dns_type::SRV:
            if (!r.u16(rec.priority) || !r.u16(rec.weight) || !r.u16(rec.port) || !r.name(rec.target)) {
                return false;
            }
            break;
        case dns_type::TXT:
            while (r.position() < rdata_end) {
                uint8_t len = 0;
                if (!r.u8(len) || r.position() + len > rdata_end) return false;
                if (len > 0) {
                    rec.txt.emplace_back(reinterpret_cast<const char*>(r.at(r.position())), len);
                }
                if (!r.skip(len)) return false;
            }
            break;
        case dns_type::A: {
            if (rdlength != 4) return false;
            const uint8_t* raw = r.at(r.position());
            if (!r.skip(4)) return false;
            char buf[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, raw, buf, sizeof(buf));
            rec.address = buf;
            break;
        }
        case dns_type::AAAA: {
            if (rdlength != 16) return false;
            const uint8_t* raw = r.at(r.position());
            if (!r.skip(16)) return false;
            char buf[INET6_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET6, raw, buf, sizeof(buf));
            rec.address = buf;
            break;
        }
        default:
            if (!r.skip(rdlength)) return false;
            break;
    }

    // Compressed rdata names leave the cursor inside the record
    if (r.position() > rdata_end) return false;
    return r.skip(rdata_end - r.position());
}

} // anonymous namespace

std::optional<std::vector<uint8_t>> encode_dns_message(const DnsMessage& message) {
    Writer w;
    w.u16(message.id);
    w.u16(message.flags);
    w.u16(static_cast<uint16_t>(message.questions.size()));
    w.u16(static_cast<uint16_t>(message.answers.size()));
    w.u16(static_cast<uint16_t>(message.authorities.size()));
    w.u16(static_cast<uint16_t>(message.additionals.size()));

    for (const auto& q : message.questions) {
        if (!w.name(q.name)) return std::nullopt;
        w.u16(q.type);
        w.u16(static_cast<uint16_t>((q.qclass & CLASS_MASK) | (q.unicast_response ? TOP_BIT : 0)));
    }
    for (const auto* section : {&message.answers, &message.authorities, &message.additionals}) {
        for (const auto& rec : *section) {
            if (!write_record(w, rec)) return std::nullopt;
        }
    }
    return w.take();
}

std::optional<DnsMessage> decode_dns_message(const uint8_t* data, size_t size) {
    if (data == nullptr) return std::nullopt;

    Reader r(data, size);
    DnsMessage msg;
    uint16_t qd = 0, an = 0, ns = 0, ar = 0;
    if (!r.u16(msg.id) || !r.u16(msg.flags) || !r.u16(qd) || !r.u16(an) || !r.u16(ns) || !r.u16(ar)) {
        return std::nullopt;
    }

    for (uint16_t i = 0; i < qd; ++i) {
        DnsQuestion q;
        uint16_t qclass = 0;
        if (!r.name(q.name) || !r.u16(q.type) || !r.u16(qclass)) return std::nullopt;
        q.qclass = qclass & CLASS_MASK;
        q.unicast_response = (qclass & TOP_BIT) != 0;
        msg.questions.push_back(std::move(q));
    }

    auto read_section = [&r](uint16_t count, std::vector<DnsRecord>& out) {
        for (uint16_t i = 0; i < count; ++i) {
            DnsRecord rec;
            if (!read_record(r, rec)) return false;
            out.push_back(std::move(rec));
        }
        return true;
    };

    if (!read_section(an, msg.answers) || !read_section(ns, msg.authorities) ||
        !read_section(ar, msg.additionals)) {
        return std::nullopt;
    }
    return msg;
}

std::string normalize_dns_name(const std::string& name) {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (out.size() > 1 && out.back() == '.' && out[out.size() - 2] == '.') {
        out.pop_back();
    }
    if (out.empty() || out.back() != '.') {
        out.push_back('.');
    }
    return out;
}

std::vector<std::string> make_txt_strings(const std::map<std::string, std::string>& properties) {
    std::vector<std::string> out;
    out.reserve(properties.size());
    for (const auto& [key, value] : properties) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::map<std::string, std::string> parse_txt_strings(const std::vector<std::string>& strings) {
    std::map<std::string, std::string> out;
    for (const auto& s : strings) {
        auto eq = s.find('=');
        if (eq == 0) continue;
        if (eq == std::string::npos) {
            out.emplace(s, "");
        } else {
            out.emplace(s.substr(0, eq), s.substr(eq + 1));
        }
    }
    return out;
}

} // namespace nodemesh
