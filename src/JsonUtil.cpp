#include "JsonUtil.hpp"

#include <cstdio>
#include <stdexcept>

namespace {

// Position right after the ':' that follows "key", or npos.
size_t valueStart(const std::string& json, const std::string& key) {
    std::string needle = '"' + key + '"';
    size_t keyPos = json.find(needle);
    if (keyPos == std::string::npos) return std::string::npos;
    size_t colon = json.find(':', keyPos + needle.size());
    if (colon == std::string::npos) return std::string::npos;
    size_t pos = colon + 1;
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\t' || json[pos] == '\n' || json[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

// Reads a quoted string starting at json[pos] == '"'. Handles backslash escapes.
// Returns the position after the closing quote, or npos on malformed input.
size_t readQuoted(const std::string& json, size_t pos, std::string& out) {
    if (pos >= json.size() || json[pos] != '"') return std::string::npos;
    out.clear();
    for (size_t i = pos + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') return i + 1;
        if (c == '\\' && i + 1 < json.size()) {
            char n = json[++i];
            switch (n) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                default:  out.push_back(n); break;
            }
            continue;
        }
        out.push_back(c);
    }
    return std::string::npos;
}

} // anonymous namespace

std::string extractJsonString(const std::string& json, const std::string& key) {
    size_t pos = valueStart(json, key);
    if (pos == std::string::npos) return "";
    std::string out;
    if (readQuoted(json, pos, out) == std::string::npos) return "";
    return out;
}

std::optional<long> extractJsonInt(const std::string& json, const std::string& key) {
    size_t pos = valueStart(json, key);
    if (pos == std::string::npos || pos >= json.size()) return std::nullopt;
    if (json[pos] == '"') ++pos;
    size_t end = pos;
    if (end < json.size() && json[end] == '-') ++end;
    while (end < json.size() && json[end] >= '0' && json[end] <= '9') ++end;
    if (end == pos || (end == pos + 1 && json[pos] == '-')) return std::nullopt;
    try {
        return std::stol(json.substr(pos, end - pos));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> extractJsonStringArray(const std::string& json, const std::string& key) {
    std::vector<std::string> out;
    size_t pos = valueStart(json, key);
    if (pos == std::string::npos || pos >= json.size() || json[pos] != '[') return out;
    ++pos;
    while (pos < json.size()) {
        char c = json[pos];
        if (c == ']') break;
        if (c == '"') {
            std::string item;
            size_t next = readQuoted(json, pos, item);
            if (next == std::string::npos) break;
            out.emplace_back(std::move(item));
            pos = next;
            continue;
        }
        ++pos;
    }
    return out;
}

std::string jsonEscape(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (unsigned char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

std::string jsonQuote(const std::string& value) {
    return '"' + jsonEscape(value) + '"';
}
