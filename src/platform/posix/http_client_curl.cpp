#include "nabunet/platform/posix/http_client_curl.h"

#include "nabunet/core/logging.h"

#if NN_WITH_CURL == 1

#include <limits>
#include <string>

// curl headers are only included in curl-specific files
#include <curl/curl.h>

namespace nabunet::platform::posix {

static constexpr const char* TAG = "http";

static void ensure_curl_global_init()
{
    static const bool inited = []{
        curl_global_init(CURL_GLOBAL_DEFAULT);
        return true;
    }();
    (void)inited;
}

HttpClientCurl::HttpClientCurl()
{
    ensure_curl_global_init();
}

std::size_t HttpClientCurl::write_body_cb(
    char *ptr,
    std::size_t size,
    std::size_t nmemb,
    void *userdata)
{
    auto *body = static_cast<std::vector<std::uint8_t> *>(userdata);
    if (!body || !ptr)
        return 0;

    // Guard overflow: n = size * nmemb
    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size))
        return 0; // abort transfer

    const std::size_t n = size * nmemb;
    body->insert(body->end(),
                 reinterpret_cast<const std::uint8_t *>(ptr),
                 reinterpret_cast<const std::uint8_t *>(ptr) + n);
    return n;
}

net::HttpResponse HttpClientCurl::get(const net::HttpRequest& req)
{
    net::HttpResponse resp;

    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return resp;
    }

    curl_slist* slist = nullptr;
    for (const auto& kv : req.headers) {
        std::string line;
        line.reserve(kv.first.size() + 2 + kv.second.size());
        line.append(kv.first);
        line.append(": ");
        line.append(kv.second);
        slist = curl_slist_append(slist, line.c_str());
    }
    if (slist) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, slist);
    }

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &HttpClientCurl::write_body_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, req.timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    const CURLcode res = curl_easy_perform(curl);

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    resp.status = static_cast<std::uint16_t>(httpCode < 0 ? 0 : httpCode);

    if (res != CURLE_OK) {
        resp.error = curl_easy_strerror(res);
        resp.body.clear();
        NN_LOGW(TAG, "GET %s failed: %s", req.url.c_str(), resp.error.c_str());
    } else {
        NN_LOGD(TAG, "GET %s -> %u (%zu bytes)",
                req.url.c_str(), static_cast<unsigned>(resp.status), resp.body.size());
    }

    if (slist) {
        curl_slist_free_all(slist);
    }
    curl_easy_cleanup(curl);
    return resp;
}

std::unique_ptr<net::IHttpClient> create_http_client()
{
    return std::make_unique<HttpClientCurl>();
}

} // namespace nabunet::platform::posix

#else

namespace nabunet::platform::posix {

std::unique_ptr<net::IHttpClient> create_http_client()
{
    NN_LOGW("http", "built without curl; cloud source unavailable");
    return nullptr;
}

} // namespace nabunet::platform::posix

#endif // NN_WITH_CURL
