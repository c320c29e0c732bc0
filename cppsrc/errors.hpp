#pragma once

#include <stdexcept>
#include <string>

namespace ncwire {

enum class ErrorKind {
    MissingDependency,
    InvalidInvocation,
    ConnectivityFailure,
    DestinationUnwritable,
    SourceMissing,
    IntegrityMismatch,
    TransferFailure,
    Cancelled
};

const char* to_string(ErrorKind kind);

// Fatal condition raised at its point of origin; main maps it to exit status 1.
class TransferError : public std::runtime_error {
private:
    ErrorKind kind_;

public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
};

} // namespace ncwire
