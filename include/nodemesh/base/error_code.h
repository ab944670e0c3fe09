#ifndef NODEMESH_BASE_ERROR_CODE_H
#define NODEMESH_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace nodemesh {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    IoError = 1003,
    InternalError = 1004,

    // Network errors (2000-2999)
    InterfaceUnavailable = 2001,
    ConnectionFailure = 2002,
    ConnectionClosedEarly = 2003,
    SendFailed = 2004,

    // Discovery errors (3000-3999)
    AdvertisementFailure = 3001,
    PeerParseError = 3002,
    MalformedPacket = 3003,

    // Transfer errors (4000-4999)
    IncompleteHeader = 4001,
    HashMismatch = 4002,
    TransferFailed = 4003,
    RangeRejected = 4004,

    // Liveness RPC errors (5000-5999)
    RpcFailed = 5001,
    InvalidResponse = 5002
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class NodeMeshError : public std::exception {
public:
    NodeMeshError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace nodemesh

namespace std {
template<>
struct is_error_code_enum<nodemesh::ErrorCode> : true_type {};
}

#endif // NODEMESH_BASE_ERROR_CODE_H
