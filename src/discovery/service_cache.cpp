#include "nodemesh/discovery/service_cache.h"
#include "nodemesh/base/logger.h"

namespace nodemesh {

namespace {

std::string first_label(const std::string& name) {
    auto dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

template<typename Map>
void erase_expired(Map& cache, std::chrono::steady_clock::time_point now) {
    for (auto it = cache.begin(); it != cache.end();) {
        if (it->second.expires <= now) {
            it = cache.erase(it);
        } else {
            ++it;
        }
    }
}

} // anonymous namespace

void ServiceCache::add_browsed_type(const std::string& service_type) {
    browsed_.insert(normalize_dns_name(service_type));
}

bool ServiceCache::is_browsed(const std::string& service_type) const {
    return browsed_.count(normalize_dns_name(service_type)) > 0;
}

void ServiceCache::evict_expired(Clock::time_point now) {
    erase_expired(srv_, now);
    erase_expired(txt_, now);
    erase_expired(addr_, now);

    for (auto it = pending_.begin(); it != pending_.end();) {
        const auto& p = it->second;
        if (p.queried && now - p.queried_at >= FOLLOW_UP_TIMEOUT) {
            Logger::instance().debug("Gave up resolving " + p.full_name);
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
}

ServiceCache::Update ServiceCache::apply(const DnsMessage& message, Clock::time_point now) {
    evict_expired(now);

    Update update;
    std::vector<const DnsRecord*> records;
    for (const auto* section : {&message.answers, &message.additionals}) {
        for (const auto& rec : *section) {
            records.push_back(&rec);
        }
    }

    for (const auto* rec : records) {
        std::string owner = normalize_dns_name(rec->name);
        auto expires = now + std::chrono::seconds(rec->ttl);
        if (rec->type == dns_type::SRV) {
            if (rec->ttl == 0) {
                srv_.erase(owner);
            } else {
                srv_[owner] = {SrvData{rec->target, rec->port}, expires, rec->ttl};
            }
        } else if (rec->type == dns_type::TXT) {
            if (rec->ttl == 0) {
                txt_.erase(owner);
            } else {
                txt_[owner] = {rec->txt, expires, rec->ttl};
            }
        } else if (rec->type == dns_type::A || rec->type == dns_type::AAAA) {
            // Prefer IPv4 when a host announces both
            if (rec->ttl == 0) {
                addr_.erase(owner);
            } else if (rec->type == dns_type::A || !addr_.count(owner)) {
                addr_[owner] = {rec->address, expires, rec->ttl};
            }
        }
    }

    for (const auto* rec : records) {
        if (rec->type != dns_type::PTR || !is_browsed(rec->name)) continue;

        std::string key = normalize_dns_name(rec->target);
        if (rec->ttl == 0) {
            pending_.erase(key);
            srv_.erase(key);
            txt_.erase(key);

            ServiceEvent event;
            event.type = ServiceEventType::Removed;
            event.full_name = rec->target;
            event.record.instance_name = first_label(rec->target);
            event.record.service_type = rec->name;
            update.events.push_back(std::move(event));
        } else {
            auto& p = pending_[key];
            p.full_name = rec->target;
            p.service_type = rec->name;
        }
    }

    for (auto it = pending_.begin(); it != pending_.end();) {
        auto& [key, p] = *it;
        auto srv = srv_.find(key);
        auto txt = txt_.find(key);
        auto addr = srv == srv_.end() ? addr_.end() : addr_.find(normalize_dns_name(srv->second.value.target));

        if (srv == srv_.end() || txt == txt_.end() || addr == addr_.end()) {
            if (!p.queried) {
                p.queried = true;
                p.queried_at = now;
                update.follow_up.push_back(p.full_name);
            }
            ++it;
            continue;
        }

        ServiceEvent event;
        event.type = ServiceEventType::Resolved;
        event.full_name = p.full_name;
        event.record.instance_name = first_label(p.full_name);
        event.record.service_type = p.service_type;
        event.record.host_name = srv->second.value.target;
        event.record.address = addr->second.value;
        event.record.port = srv->second.value.port;
        event.record.properties = parse_txt_strings(txt->second.value);
        event.record.ttl_sec = srv->second.ttl;
        update.events.push_back(std::move(event));
        it = pending_.erase(it);
    }

    return update;
}

void ServiceCache::clear() {
    browsed_.clear();
    srv_.clear();
    txt_.clear();
    addr_.clear();
    pending_.clear();
}

size_t ServiceCache::size() const {
    return srv_.size() + txt_.size() + addr_.size() + pending_.size();
}

size_t ServiceCache::pending_count() const {
    return pending_.size();
}

} // namespace nodemesh
