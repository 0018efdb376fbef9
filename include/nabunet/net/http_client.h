#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace nabunet::net {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    bool followRedirects{true};
    long timeoutSeconds{30};
};

struct HttpResponse {
    // 0 when no HTTP response was received at all.
    std::uint16_t status{0};
    std::vector<std::uint8_t> body;
    // Transport-level failure text; empty when a response arrived.
    std::string error;

    bool transport_ok() const noexcept { return error.empty() && status != 0; }
};

// Minimal synchronous HTTP GET client.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(const HttpRequest& req) = 0;
};

} // namespace nabunet::net
