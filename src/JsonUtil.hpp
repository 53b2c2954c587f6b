// JsonUtil.hpp
// Very small JSON helpers for the proxy's own request/response bodies.
// The UI sends flat objects; a permissive key search is all we need.
#pragma once

#include <optional>
#include <string>
#include <vector>

// First string value for "key", or empty if absent.
std::string extractJsonString(const std::string& json, const std::string& key);

// First integer value for "key". Accepts quoted numbers ("level":"30").
std::optional<long> extractJsonInt(const std::string& json, const std::string& key);

// String elements of the array value for "key" ("members":["a","b"]).
std::vector<std::string> extractJsonStringArray(const std::string& json, const std::string& key);

// Escape for embedding inside a JSON string literal (quotes not included).
std::string jsonEscape(const std::string& value);

// Convenience: "\"value\"" with escaping applied.
std::string jsonQuote(const std::string& value);
