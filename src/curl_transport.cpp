#include "http_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

static void global_init_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlTransport::CurlTransport(long timeout_seconds)
    : timeout_seconds_(timeout_seconds)
{
    global_init_once();
}

HttpResponse CurlTransport::send(const HttpRequest& req) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw TransportFailure("curl init failed", false);

    struct curl_slist* headers = nullptr;
    for (const auto& h : req.headers) headers = curl_slist_append(headers, h.c_str());
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, &curl_slist_free_all);

    HttpResponse resp;
    curl_easy_setopt(curl.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    if (req.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    // TLS verify ON
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw TransportFailure(std::string("curl perform failed: ") + curl_easy_strerror(rc),
                               rc == CURLE_OPERATION_TIMEDOUT);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}
