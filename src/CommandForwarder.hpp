// CommandForwarder.hpp
#pragma once

#include "DeviceEndpoint.hpp"
#include "DeviceHttpClient.hpp"
#include "ProxyError.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

// One call against a device's native API. Path and body are passed through
// verbatim ("/volume", "<volume>30</volume>").
struct ControlRequest {
    std::string method{"GET"};
    std::string path;
    std::string body;
};

struct ForwardResult {
    HttpResponse response;  // Set whenever the device answered, success or not
    ProxyError error;

    bool ok() const { return error.ok(); }
};

// Builds the native request for a named UI action:
//   play, pause, play_pause, stop, next, previous, mute, power,
//   thumbs_up, thumbs_down            (no parameters)
//   volume      {level: 0..100}
//   preset      {preset: 1..6}
//   source      {source, sourceAccount?}
// Returns nullopt for unknown actions or missing/invalid parameters.
// Key actions produce the "press" half; use CommandForwarder::perform to get
// the press+release pair.
std::optional<ControlRequest> buildActionRequest(const std::string& action,
                                                 const std::map<std::string, std::string>& parameters);

// Key name for a key action ("next" -> "NEXT_TRACK"), empty if not a key action.
std::string keyForAction(const std::string& action, const std::map<std::string, std::string>& parameters);

// Stateless relay to the device API. No retries: several actions (next track,
// preset) are not idempotent and the protocol has no request ids.
class CommandForwarder {
public:
    explicit CommandForwarder(std::shared_ptr<DeviceHttpClient> client, long timeoutMs = 10000);

    // DeviceUnreachable when no response arrived, DeviceError{status, body}
    // for a non-2xx answer. The device payload is never rewritten.
    ForwardResult forward(const DeviceEndpoint& endpoint, const ControlRequest& request) const;

    // Resolves a named action and sends it; key actions send press then release.
    ForwardResult perform(const DeviceEndpoint& endpoint, const std::string& action,
                          const std::map<std::string, std::string>& parameters) const;

    ForwardResult pressKey(const DeviceEndpoint& endpoint, const std::string& key) const;
    ForwardResult setVolume(const DeviceEndpoint& endpoint, int level) const;

    // Fills identifier/name/type from GET /info.
    std::optional<DeviceEndpoint> identify(const DeviceEndpoint& endpoint, ProxyError& error) const;

private:
    std::shared_ptr<DeviceHttpClient> m_client;
    long m_timeoutMs;
};
