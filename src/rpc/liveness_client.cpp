#include "nodemesh/rpc/liveness.h"
#include "nodemesh/base/logger.h"
#include "nodemesh/base/error_code.h"
#include <sstream>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>

namespace nodemesh {

namespace {

// Simple synchronous HTTP client using POSIX sockets
class SimpleHttpClient {
public:
    static std::pair<int, std::string> http_request(
        const std::string& host,
        uint16_t port,
        const std::string& method,
        const std::string& path,
        const std::string& body,
        uint32_t timeout_sec) {

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* result = nullptr;
        std::string service = std::to_string(port);
        if (getaddrinfo(host.c_str(), service.c_str(), &hints, &result) != 0 || result == nullptr) {
            return {0, "Failed to resolve host"};
        }

        int sock = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
        if (sock < 0) {
            freeaddrinfo(result);
            return {0, "Failed to create socket"};
        }

        timeval timeout{};
        timeout.tv_sec = timeout_sec;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        int rc = connect(sock, result->ai_addr, result->ai_addrlen);
        freeaddrinfo(result);
        if (rc < 0) {
            close(sock);
            return {0, "Failed to connect: " + std::string(strerror(errno))};
        }

        std::ostringstream request;
        request << method << " " << path << " HTTP/1.1\r\n";
        request << "Host: " << host << ":" << port << "\r\n";
        if (!body.empty()) {
            request << "Content-Type: application/json\r\n";
            request << "Content-Length: " << body.size() << "\r\n";
        }
        request << "Connection: close\r\n";
        request << "\r\n";
        request << body;

        std::string request_str = request.str();
        size_t offset = 0;
        while (offset < request_str.size()) {
            ssize_t sent = send(sock, request_str.data() + offset, request_str.size() - offset, MSG_NOSIGNAL);
            if (sent <= 0) {
                close(sock);
                return {0, "Failed to send request"};
            }
            offset += static_cast<size_t>(sent);
        }

        std::string response;
        char buffer[4096];
        while (true) {
            ssize_t n = recv(sock, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            response.append(buffer, static_cast<size_t>(n));
        }
        close(sock);

        size_t header_end = response.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return {0, "Invalid response"};
        }

        std::string status_line = response.substr(0, response.find("\r\n"));
        int status_code = 0;
        size_t pos = status_line.find(' ');
        if (pos != std::string::npos) {
            status_code = std::atoi(status_line.c_str() + pos + 1);
        }

        return {status_code, response.substr(header_end + 4)};
    }
};

} // anonymous namespace

LivenessClient::LivenessClient(const LivenessConfig& config) : config_(config) {}

std::optional<PongResponse> LivenessClient::ping(const std::string& host, uint16_t port,
                                                 const std::string& sender,
                                                 const std::string& message) const {
    PingRequest request;
    request.sender = sender;
    request.message = message;
    request.timestamp_ms = unix_time_ms();

    auto [status, body] = SimpleHttpClient::http_request(host, port, "POST", "/api/v1/ping",
                                                         serialize_ping_request(request),
                                                         config_.request_timeout_sec);
    if (status != 200) {
        Logger::instance().warning(to_string(ErrorCode::RpcFailed) + ": ping " + host + ":" +
                                   std::to_string(port) + " (" + std::to_string(status) + " " + body + ")");
        return std::nullopt;
    }

    auto response = parse_pong_response(body);
    if (!response) {
        Logger::instance().warning(to_string(ErrorCode::InvalidResponse) + " from " + host);
    }
    return response;
}

std::optional<PongResponse> LivenessClient::ping(const NodeInfo& peer, const std::string& sender,
                                                 const std::string& message) const {
    return ping(peer.ip, peer.port, sender, message);
}

std::optional<HealthCheckResponse> LivenessClient::health_check(const std::string& host, uint16_t port) const {
    auto [status, body] = SimpleHttpClient::http_request(host, port, "GET", "/api/v1/health", "",
                                                         config_.request_timeout_sec);
    if (status != 200) {
        Logger::instance().warning(to_string(ErrorCode::RpcFailed) + ": health " + host + ":" +
                                   std::to_string(port) + " (" + std::to_string(status) + " " + body + ")");
        return std::nullopt;
    }

    auto response = parse_health_response(body);
    if (!response) {
        Logger::instance().warning(to_string(ErrorCode::InvalidResponse) + " from " + host);
    }
    return response;
}

std::optional<HealthCheckResponse> LivenessClient::health_check(const NodeInfo& peer) const {
    return health_check(peer.ip, peer.port);
}

} // namespace nodemesh
