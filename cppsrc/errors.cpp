#include "errors.hpp"

namespace ncwire {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingDependency: return "MissingDependency";
        case ErrorKind::InvalidInvocation: return "InvalidInvocation";
        case ErrorKind::ConnectivityFailure: return "ConnectivityFailure";
        case ErrorKind::DestinationUnwritable: return "DestinationUnwritable";
        case ErrorKind::SourceMissing: return "SourceMissing";
        case ErrorKind::IntegrityMismatch: return "IntegrityMismatch";
        case ErrorKind::TransferFailure: return "TransferFailure";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

} // namespace ncwire
