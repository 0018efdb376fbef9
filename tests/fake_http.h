#pragma once

#include <map>
#include <string>
#include <vector>

#include "nabunet/net/http_client.h"

namespace nabunet::tests {

// Canned responses keyed by URL; anything else is a 404.
class FakeHttpClient final : public nabunet::net::IHttpClient {
public:
    nabunet::net::HttpResponse get(const nabunet::net::HttpRequest& req) override
    {
        requests.push_back(req);
        auto it = responses.find(req.url);
        if (it != responses.end()) {
            return it->second;
        }
        nabunet::net::HttpResponse notFound;
        notFound.status = 404;
        return notFound;
    }

    void add(const std::string& url, std::uint16_t status, std::vector<std::uint8_t> body = {})
    {
        nabunet::net::HttpResponse r;
        r.status = status;
        r.body = std::move(body);
        responses[url] = std::move(r);
    }

    void fail(const std::string& url, std::string error)
    {
        nabunet::net::HttpResponse r;
        r.error = std::move(error);
        responses[url] = std::move(r);
    }

    std::map<std::string, nabunet::net::HttpResponse> responses;
    std::vector<nabunet::net::HttpRequest> requests;
};

} // namespace nabunet::tests
