// ProxyError.hpp
// Error taxonomy shared by discovery, forwarding and zone handling.
#pragma once

#include <string>

enum class ProxyErrorKind {
    None,
    NoDeviceFound,               // Every resolution strategy came back empty
    DeviceUnreachable,           // Connect/timeout talking to a known endpoint
    DeviceError,                 // Device answered with a non-2xx status
    ZoneCreationFailed,          // Zone was rolled back
    PartialZoneOperationFailure, // Best-effort fan-out had mixed results
    ZoneNotFound,
    InvalidZoneOperation,
    InvalidRequest               // Unknown action, malformed body, no device selected
};

struct ProxyError {
    ProxyErrorKind kind{ProxyErrorKind::None};
    int statusCode{0};      // Device status for DeviceError
    std::string body;       // Device payload for DeviceError, verbatim
    std::string message;

    bool ok() const { return kind == ProxyErrorKind::None; }

    static ProxyError noDeviceFound(std::string message);
    static ProxyError unreachable(const std::string& target, const std::string& reason);
    static ProxyError deviceError(int statusCode, std::string body);
    static ProxyError zoneCreationFailed(std::string message);
    static ProxyError partialFailure(std::string message);
    static ProxyError zoneNotFound(const std::string& zoneName);
    static ProxyError invalidZoneOperation(std::string message);
    static ProxyError invalidRequest(std::string message);
};

const char* errorKindName(ProxyErrorKind kind);

// One-line human readable form, used for logging and JSON error bodies.
std::string describe(const ProxyError& error);

// Status the inbound HTTP surface answers with for this error.
int httpStatusFor(const ProxyError& error);
