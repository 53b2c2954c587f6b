#include "CommandForwarder.hpp"

#include "SoundTouchXml.hpp"

#include <iostream>
#include <stdexcept>

namespace {

std::optional<int> intParam(const std::map<std::string, std::string>& parameters, const std::string& name) {
    auto it = parameters.find(name);
    if (it == parameters.end() || it->second.empty()) return std::nullopt;
    try {
        size_t used = 0;
        int v = std::stoi(it->second, &used);
        if (used != it->second.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // anonymous namespace

std::string keyForAction(const std::string& action, const std::map<std::string, std::string>& parameters) {
    static const std::map<std::string, std::string> keys = {
        {"play", "PLAY"},
        {"pause", "PAUSE"},
        {"play_pause", "PLAY_PAUSE"},
        {"stop", "STOP"},
        {"next", "NEXT_TRACK"},
        {"previous", "PREV_TRACK"},
        {"mute", "MUTE"},
        {"power", "POWER"},
        {"thumbs_up", "THUMBS_UP"},
        {"thumbs_down", "THUMBS_DOWN"},
    };
    auto it = keys.find(action);
    if (it != keys.end()) return it->second;

    if (action == "preset") {
        auto preset = intParam(parameters, "preset");
        if (preset && *preset >= 1 && *preset <= 6) {
            return "PRESET_" + std::to_string(*preset);
        }
    }
    return "";
}

std::optional<ControlRequest> buildActionRequest(const std::string& action,
                                                 const std::map<std::string, std::string>& parameters) {
    std::string key = keyForAction(action, parameters);
    if (!key.empty()) {
        return ControlRequest{"POST", "/key", SoundTouch::keyXml(key, "press")};
    }

    if (action == "volume") {
        auto level = intParam(parameters, "level");
        if (!level || *level < 0 || *level > 100) return std::nullopt;
        return ControlRequest{"POST", "/volume", SoundTouch::volumeXml(*level)};
    }

    if (action == "source") {
        auto source = parameters.find("source");
        if (source == parameters.end() || source->second.empty()) return std::nullopt;
        auto account = parameters.find("sourceAccount");
        return ControlRequest{"POST", "/select",
                              SoundTouch::contentItemXml(source->second,
                                                         account == parameters.end() ? "" : account->second)};
    }

    return std::nullopt;
}

CommandForwarder::CommandForwarder(std::shared_ptr<DeviceHttpClient> client, long timeoutMs)
    : m_client(std::move(client)), m_timeoutMs(timeoutMs) {
}

ForwardResult CommandForwarder::forward(const DeviceEndpoint& endpoint, const ControlRequest& request) const {
    ForwardResult result;
    std::string path = request.path.empty() || request.path[0] != '/' ? "/" + request.path : request.path;
    std::string url = endpoint.baseUrl() + path;

    HttpOutcome outcome = m_client->request(request.method, url, request.body, m_timeoutMs);
    if (!outcome.transportOk) {
        std::cerr << "[Forwarder] " << request.method << " " << url << " failed: " << outcome.error << std::endl;
        result.error = ProxyError::unreachable(endpoint.hostPort(), outcome.error);
        return result;
    }

    result.response = std::move(outcome.response);
    if (result.response.statusCode < 200 || result.response.statusCode >= 300) {
        std::cerr << "[Forwarder] " << request.method << " " << url << " -> HTTP "
                  << result.response.statusCode << std::endl;
        result.error = ProxyError::deviceError(static_cast<int>(result.response.statusCode), result.response.body);
    }
    return result;
}

ForwardResult CommandForwarder::perform(const DeviceEndpoint& endpoint, const std::string& action,
                                        const std::map<std::string, std::string>& parameters) const {
    std::string key = keyForAction(action, parameters);
    if (!key.empty()) {
        return pressKey(endpoint, key);
    }
    auto request = buildActionRequest(action, parameters);
    if (!request) {
        ForwardResult result;
        result.error = ProxyError::invalidRequest("Unknown action or bad parameters: " + action);
        return result;
    }
    return forward(endpoint, *request);
}

ForwardResult CommandForwarder::pressKey(const DeviceEndpoint& endpoint, const std::string& key) const {
    // SoundTouch keys are a press/release pair
    ForwardResult press = forward(endpoint, {"POST", "/key", SoundTouch::keyXml(key, "press")});
    if (!press.ok()) return press;
    return forward(endpoint, {"POST", "/key", SoundTouch::keyXml(key, "release")});
}

ForwardResult CommandForwarder::setVolume(const DeviceEndpoint& endpoint, int level) const {
    return forward(endpoint, {"POST", "/volume", SoundTouch::volumeXml(level)});
}

std::optional<DeviceEndpoint> CommandForwarder::identify(const DeviceEndpoint& endpoint, ProxyError& error) const {
    ForwardResult r = forward(endpoint, {"GET", "/info", ""});
    if (!r.ok()) {
        error = r.error;
        return std::nullopt;
    }
    auto info = SoundTouch::parseDeviceInfo(r.response.body);
    if (!info || info->deviceId.empty()) {
        error = ProxyError::deviceError(502, r.response.body);
        error.message = "Device at " + endpoint.hostPort() + " returned /info without a deviceID";
        return std::nullopt;
    }
    DeviceEndpoint identified = endpoint;
    identified.identifier = info->deviceId;
    identified.displayName = info->name;
    identified.type = info->type;
    return identified;
}
