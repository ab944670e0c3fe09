#include "nodemesh/discovery/mdns_daemon.h"
#include "nodemesh/discovery/dns_message.h"
#include "nodemesh/discovery/service_cache.h"
#include "nodemesh/base/logger.h"
#include "nodemesh/base/error_code.h"
#include <thread>
#include <atomic>
#include <mutex>
#include <vector>
#include <set>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace nodemesh {

namespace {

constexpr size_t MAX_PACKET_SIZE = 9000;
constexpr int EVICT_INTERVAL_MS = 1000;

std::vector<DnsRecord> build_records(const ServiceRecord& record, uint32_t ttl) {
    std::vector<DnsRecord> records;
    std::string full = record.full_name();

    DnsRecord ptr;
    ptr.name = record.service_type;
    ptr.type = dns_type::PTR;
    ptr.ttl = ttl;
    ptr.target = full;
    records.push_back(ptr);

    DnsRecord srv;
    srv.name = full;
    srv.type = dns_type::SRV;
    srv.cache_flush = true;
    srv.ttl = ttl;
    srv.port = record.port;
    srv.target = record.host_name;
    records.push_back(srv);

    DnsRecord txt;
    txt.name = full;
    txt.type = dns_type::TXT;
    txt.cache_flush = true;
    txt.ttl = ttl;
    txt.txt = make_txt_strings(record.properties);
    records.push_back(txt);

    if (!record.address.empty()) {
        DnsRecord addr;
        addr.name = record.host_name;
        addr.type = record.address.find(':') == std::string::npos ? dns_type::A : dns_type::AAAA;
        addr.cache_flush = true;
        addr.ttl = ttl;
        addr.address = record.address;
        records.push_back(addr);
    }
    return records;
}

} // anonymous namespace

std::string ServiceRecord::full_name() const {
    std::string type = service_type;
    if (!type.empty() && type.back() != '.') {
        type.push_back('.');
    }
    return instance_name + "." + type;
}

struct MdnsDaemon::Impl {
    std::string interface_ip;
    int sock = -1;
    int stop_pipe[2] = {-1, -1};
    std::thread receive_thread;
    std::atomic<bool> running{false};

    std::mutex mutex;
    std::map<std::string, ServiceRecord> services;              // normalized full name
    std::map<std::string, ServiceEventCallback> browsers;       // normalized service type

    ServiceCache cache;

    explicit Impl(std::string ip) : interface_ip(std::move(ip)) {}

    bool open() {
        if (running.load()) {
            return true;
        }

        sock = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (sock < 0) {
            Logger::instance().error("Failed to create mDNS socket: " + std::string(strerror(errno)));
            return false;
        }

        int one = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
#ifdef SO_REUSEPORT
        setsockopt(sock, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one));
#endif

        sockaddr_in bind_addr{};
        bind_addr.sin_family = AF_INET;
        bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
        bind_addr.sin_port = htons(MDNS_PORT);
        if (::bind(sock, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
            Logger::instance().error("Failed to bind mDNS socket: " + std::string(strerror(errno)));
            close_fds();
            return false;
        }

        in_addr iface{};
        if (inet_pton(AF_INET, interface_ip.c_str(), &iface) != 1) {
            iface.s_addr = htonl(INADDR_ANY);
        }

        ip_mreq mreq{};
        inet_pton(AF_INET, MDNS_MULTICAST_ADDRESS, &mreq.imr_multiaddr);
        mreq.imr_interface = iface;
        if (setsockopt(sock, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
            Logger::instance().error("Failed to join mDNS group on " + interface_ip + ": " +
                                     std::string(strerror(errno)));
            close_fds();
            return false;
        }

        setsockopt(sock, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface));
        unsigned char ttl = 255;
        setsockopt(sock, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
        // Nodes sharing a host must hear each other
        unsigned char loop = 1;
        setsockopt(sock, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));

        if (pipe(stop_pipe) == -1) {
            Logger::instance().error("Failed to create stop pipe for mDNS daemon");
            close_fds();
            return false;
        }

        running = true;
        receive_thread = std::thread([this]() { receive_loop(); });
        Logger::instance().debug("mDNS daemon listening on " + std::string(MDNS_MULTICAST_ADDRESS) + ":" +
                                 std::to_string(MDNS_PORT) + " via " + interface_ip);
        return true;
    }

    void close_fds() {
        if (sock >= 0) {
            ::close(sock);
            sock = -1;
        }
        for (int& fd : stop_pipe) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }
    }

    bool send(const DnsMessage& msg) {
        auto packet = encode_dns_message(msg);
        if (!packet) {
            Logger::instance().error("Failed to encode mDNS message");
            return false;
        }

        sockaddr_in dest{};
        dest.sin_family = AF_INET;
        dest.sin_port = htons(MDNS_PORT);
        inet_pton(AF_INET, MDNS_MULTICAST_ADDRESS, &dest.sin_addr);

        ssize_t sent = ::sendto(sock, packet->data(), packet->size(), 0,
                                reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
        if (sent != static_cast<ssize_t>(packet->size())) {
            Logger::instance().warning("mDNS send failed: " + std::string(strerror(errno)));
            return false;
        }
        return true;
    }

    bool announce(const ServiceRecord& record, uint32_t ttl) {
        DnsMessage msg;
        msg.flags = DNS_FLAG_RESPONSE | DNS_FLAG_AUTHORITATIVE;
        msg.answers = build_records(record, ttl);
        return send(msg);
    }

    void receive_loop() {
        std::vector<uint8_t> buffer(MAX_PACKET_SIZE);

        while (running.load()) {
            pollfd fds[2];
            fds[0] = {sock, POLLIN, 0};
            fds[1] = {stop_pipe[0], POLLIN, 0};

            int ready = ::poll(fds, 2, EVICT_INTERVAL_MS);
            if (ready < 0) {
                if (errno == EINTR) continue;
                Logger::instance().error("mDNS poll failed: " + std::string(strerror(errno)));
                break;
            }
            if (ready == 0) {
                std::lock_guard<std::mutex> lock(mutex);
                cache.evict_expired(ServiceCache::Clock::now());
                continue;
            }
            if (fds[1].revents & POLLIN) {
                break;
            }
            if (!(fds[0].revents & POLLIN)) {
                continue;
            }

            ssize_t n = ::recvfrom(sock, buffer.data(), buffer.size(), 0, nullptr, nullptr);
            if (n <= 0) {
                continue;
            }

            auto msg = decode_dns_message(buffer.data(), static_cast<size_t>(n));
            if (!msg) {
                Logger::instance().debug(to_string(ErrorCode::MalformedPacket) + ", " + std::to_string(n) + " bytes");
                continue;
            }

            if (msg->is_response()) {
                handle_response(*msg);
            } else {
                handle_query(*msg);
            }
        }
    }

    void handle_query(const DnsMessage& query) {
        DnsMessage response;
        response.flags = DNS_FLAG_RESPONSE | DNS_FLAG_AUTHORITATIVE;

        {
            std::lock_guard<std::mutex> lock(mutex);
            std::set<std::string> matched;

            for (const auto& q : query.questions) {
                std::string qname = normalize_dns_name(q.name);
                for (const auto& [key, record] : services) {
                    bool type_match = (q.type == dns_type::PTR || q.type == dns_type::ANY) &&
                                      normalize_dns_name(record.service_type) == qname;
                    bool instance_match = qname == key;
                    bool host_match = qname == normalize_dns_name(record.host_name);
                    if (type_match || instance_match || host_match) {
                        matched.insert(key);
                    }
                }
            }

            for (const auto& key : matched) {
                const auto& record = services.at(key);
                auto records = build_records(record, record.ttl_sec);
                response.answers.insert(response.answers.end(), records.begin(), records.end());
            }
        }

        if (!response.answers.empty()) {
            send(response);
        }
    }

    void handle_response(const DnsMessage& msg) {
        std::vector<std::pair<ServiceEventCallback, ServiceEvent>> events;
        ServiceCache::Update update;

        {
            std::lock_guard<std::mutex> lock(mutex);
            update = cache.apply(msg, ServiceCache::Clock::now());
            for (auto& event : update.events) {
                auto browser = browsers.find(normalize_dns_name(event.record.service_type));
                if (browser != browsers.end()) {
                    events.emplace_back(browser->second, std::move(event));
                }
            }
        }

        for (const auto& name : update.follow_up) {
            DnsMessage query;
            DnsQuestion q;
            q.name = name;
            q.type = dns_type::ANY;
            query.questions.push_back(q);
            send(query);
        }

        for (const auto& [callback, event] : events) {
            callback(event);
        }
    }
};

MdnsDaemon::MdnsDaemon(const std::string& interface_ip)
    : impl_(std::make_unique<Impl>(interface_ip)) {}

MdnsDaemon::~MdnsDaemon() {
    shutdown();
}

bool MdnsDaemon::register_service(const ServiceRecord& record) {
    if (!impl_->open()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->services[normalize_dns_name(record.full_name())] = record;
    }
    return impl_->announce(record, record.ttl_sec);
}

bool MdnsDaemon::unregister_service(const std::string& full_name) {
    ServiceRecord record;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->services.find(normalize_dns_name(full_name));
        if (it == impl_->services.end()) {
            return false;
        }
        record = it->second;
        impl_->services.erase(it);
    }
    if (!impl_->running.load()) {
        return false;
    }
    // TTL 0 is the goodbye announcement
    return impl_->announce(record, 0);
}

bool MdnsDaemon::browse(const std::string& service_type, ServiceEventCallback callback) {
    if (!impl_->open()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->browsers[normalize_dns_name(service_type)] = std::move(callback);
        impl_->cache.add_browsed_type(service_type);
    }

    DnsMessage query;
    DnsQuestion q;
    q.name = service_type;
    q.type = dns_type::PTR;
    query.questions.push_back(q);
    return impl_->send(query);
}

void MdnsDaemon::shutdown() {
    if (!impl_->running.load()) {
        return;
    }

    std::vector<ServiceRecord> remaining;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& [key, record] : impl_->services) {
            remaining.push_back(record);
        }
        impl_->services.clear();
        impl_->browsers.clear();
        impl_->cache.clear();
    }
    for (const auto& record : remaining) {
        if (!impl_->announce(record, 0)) {
            Logger::instance().warning("Failed to send goodbye for " + record.full_name());
        }
    }

    impl_->running = false;
    char c = 'x';
    if (write(impl_->stop_pipe[1], &c, 1) != 1) {
        Logger::instance().warning("Failed to signal mDNS receive thread");
    }
    if (impl_->receive_thread.joinable()) {
        impl_->receive_thread.join();
    }
    impl_->close_fds();
    Logger::instance().debug("mDNS daemon stopped");
}

} // namespace nodemesh
