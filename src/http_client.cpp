// ============================================================================
// http_client.cpp: implementation for http_client.hpp
// ============================================================================

#include "http_client.hpp"

#include <algorithm>

#include <curl/curl.h>

namespace endec {

CurlGlobal::CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) {}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

// Collect up to RESPONSE_CAP bytes; anything past that is discarded but
// still acknowledged so curl does not abort the transfer.
static size_t collect_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    const size_t n = size * nmemb;
    const size_t room = CurlHttpClient::RESPONSE_CAP - std::min(out->size(), CurlHttpClient::RESPONSE_CAP);
    out->append(ptr, std::min(n, room));
    return n;
}

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent)) {}

HttpResponse CurlHttpClient::post_json(const std::string& url,
                                       const std::string& body,
                                       std::chrono::seconds timeout) {
    HttpResponse resp;

    CURL* c = curl_easy_init();
    if (!c) {
        resp.error = "curl_easy_init failed";
        return resp;
    }

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(c, CURLOPT_URL,            url.c_str());
    curl_easy_setopt(c, CURLOPT_POST,           1L);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(c, CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(c, CURLOPT_USERAGENT,      user_agent_.c_str());
    curl_easy_setopt(c, CURLOPT_TIMEOUT,        static_cast<long>(timeout.count()));
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECT_TIMEOUT.count()));
    curl_easy_setopt(c, CURLOPT_NOSIGNAL,       1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION,  collect_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA,      &resp.body);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER,    errbuf);

    const CURLcode res = curl_easy_perform(c);
    if (res != CURLE_OK) {
        resp.error = errbuf[0] ? errbuf : curl_easy_strerror(res);
    } else {
        curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(c);
    return resp;
}

} // namespace endec
