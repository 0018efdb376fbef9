#pragma once

#include <memory>

#include "nabunet/net/http_client.h"

#if NN_WITH_CURL == 1

#include <cstddef>

namespace nabunet::platform::posix {

class HttpClientCurl final : public net::IHttpClient {
public:
    HttpClientCurl();

    net::HttpResponse get(const net::HttpRequest& req) override;

private:
    static std::size_t write_body_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);
};

} // namespace nabunet::platform::posix

#endif // NN_WITH_CURL

namespace nabunet::platform::posix {

// Curl client when built with NN_WITH_CURL, otherwise nullptr.
std::unique_ptr<net::IHttpClient> create_http_client();

} // namespace nabunet::platform::posix
