// DeviceHttpClient.hpp
#pragma once

#include <string>

struct HttpResponse {
    long statusCode{0};
    std::string body;
    std::string contentType;
};

// Result of one outbound request. transportOk is false when no HTTP response
// arrived at all (refused, timed out, DNS failure); 'error' then says why.
struct HttpOutcome {
    bool transportOk{false};
    HttpResponse response;
    std::string error;
};

// Outbound HTTP to device control APIs. Abstract so discovery, forwarding and
// zone handling can be exercised against a fake device in tests.
class DeviceHttpClient {
public:
    virtual ~DeviceHttpClient() = default;

    // method is "GET" or "POST" (anything else is sent as a custom verb).
    // body is sent with Content-Type: application/xml when non-empty.
    virtual HttpOutcome request(const std::string& method, const std::string& url,
                                const std::string& body, long timeoutMs) = 0;
};

// libcurl-backed client. One easy handle per request, so it is safe to share
// across the scan workers and connection threads.
class CurlHttpClient : public DeviceHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpOutcome request(const std::string& method, const std::string& url,
                        const std::string& body, long timeoutMs) override;

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
};
