#include "ProxyError.hpp"

#include <utility>

ProxyError ProxyError::noDeviceFound(std::string message) {
    ProxyError e;
    e.kind = ProxyErrorKind::NoDeviceFound;
    e.message = std::move(message);
    return e;
}

ProxyError ProxyError::unreachable(const std::string& target, const std::string& reason) {
    ProxyError e;
    e.kind = ProxyErrorKind::DeviceUnreachable;
    e.message = "Error connecting to SoundTouch at " + target + ": " + reason;
    return e;
}

ProxyError ProxyError::deviceError(int statusCode, std::string body) {
    ProxyError e;
    e.kind = ProxyErrorKind::DeviceError;
    e.statusCode = statusCode;
    e.body = std::move(body);
    e.message = "Device rejected request with HTTP " + std::to_string(statusCode);
    return e;
}

ProxyError ProxyError::zoneCreationFailed(std::string message) {
    ProxyError e;
    e.kind = ProxyErrorKind::ZoneCreationFailed;
    e.message = std::move(message);
    return e;
}

ProxyError ProxyError::partialFailure(std::string message) {
    ProxyError e;
    e.kind = ProxyErrorKind::PartialZoneOperationFailure;
    e.message = std::move(message);
    return e;
}

ProxyError ProxyError::zoneNotFound(const std::string& zoneName) {
    ProxyError e;
    e.kind = ProxyErrorKind::ZoneNotFound;
    e.message = "Zone not found: " + zoneName;
    return e;
}

ProxyError ProxyError::invalidZoneOperation(std::string message) {
    ProxyError e;
    e.kind = ProxyErrorKind::InvalidZoneOperation;
    e.message = std::move(message);
    return e;
}

ProxyError ProxyError::invalidRequest(std::string message) {
    ProxyError e;
    e.kind = ProxyErrorKind::InvalidRequest;
    e.message = std::move(message);
    return e;
}

const char* errorKindName(ProxyErrorKind kind) {
    switch (kind) {
        case ProxyErrorKind::None:                        return "None";
        case ProxyErrorKind::NoDeviceFound:               return "NoDeviceFound";
        case ProxyErrorKind::DeviceUnreachable:           return "DeviceUnreachable";
        case ProxyErrorKind::DeviceError:                 return "DeviceError";
        case ProxyErrorKind::ZoneCreationFailed:          return "ZoneCreationFailed";
        case ProxyErrorKind::PartialZoneOperationFailure: return "PartialZoneOperationFailure";
        case ProxyErrorKind::ZoneNotFound:                return "ZoneNotFound";
        case ProxyErrorKind::InvalidZoneOperation:        return "InvalidZoneOperation";
        case ProxyErrorKind::InvalidRequest:              return "InvalidRequest";
    }
    return "Unknown";
}

std::string describe(const ProxyError& error) {
    if (error.ok()) return "ok";
    std::string out = errorKindName(error.kind);
    if (!error.message.empty()) out += ": " + error.message;
    return out;
}

int httpStatusFor(const ProxyError& error) {
    switch (error.kind) {
        case ProxyErrorKind::None:                        return 200;
        case ProxyErrorKind::NoDeviceFound:               return 404;
        case ProxyErrorKind::DeviceUnreachable:           return 502;
        case ProxyErrorKind::DeviceError:
            // Device status passes through so the UI can show the native message
            return error.statusCode > 0 ? error.statusCode : 502;
        case ProxyErrorKind::ZoneCreationFailed:          return 409;
        case ProxyErrorKind::PartialZoneOperationFailure: return 207;
        case ProxyErrorKind::ZoneNotFound:                return 404;
        case ProxyErrorKind::InvalidZoneOperation:        return 400;
        case ProxyErrorKind::InvalidRequest:              return 400;
    }
    return 500;
}
