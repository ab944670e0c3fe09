#include "nodemesh/base/error_code.h"

namespace nodemesh {

namespace {

class NodeMeshCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "NodeMesh";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const NodeMeshCategory& get_category() {
    static NodeMeshCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InterfaceUnavailable: return "No suitable network interface found";
        case ErrorCode::ConnectionFailure: return "Connection failed";
        case ErrorCode::ConnectionClosedEarly: return "Connection closed early";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::AdvertisementFailure: return "Service advertisement failed";
        case ErrorCode::PeerParseError: return "Malformed peer advertisement";
        case ErrorCode::MalformedPacket: return "Malformed discovery packet";
        case ErrorCode::IncompleteHeader: return "Incomplete transfer header";
        case ErrorCode::HashMismatch: return "File hash mismatch";
        case ErrorCode::TransferFailed: return "Transfer failed";
        case ErrorCode::RangeRejected: return "Range rejected by receiver";
        case ErrorCode::RpcFailed: return "Liveness request failed";
        case ErrorCode::InvalidResponse: return "Invalid liveness response";
        default: return "Unknown error";
    }
}

NodeMeshError::NodeMeshError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* NodeMeshError::what() const noexcept {
    return message_.c_str();
}

} // namespace nodemesh
