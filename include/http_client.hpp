/**
 * @file http_client.hpp
 * @brief libcurl implementation of endec::IHttpClient.
 *
 * One easy handle per request, JSON content type, hard total timeout plus a
 * shorter connect timeout, redirects not followed. Responses are capped at
 * RESPONSE_CAP bytes (enough for an error message). Never throws.
 *
 * CurlGlobal is an RAII guard for curl_global_init/cleanup; create exactly
 * one in main() before any client is used.
 */
#pragma once
#include <chrono>
#include <string>

#include "endec/http.hpp"

namespace endec {

class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_;
};

class CurlHttpClient : public IHttpClient {
public:
    static constexpr size_t RESPONSE_CAP = 4096;
    static constexpr std::chrono::seconds CONNECT_TIMEOUT{5};

    explicit CurlHttpClient(std::string user_agent);

    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           std::chrono::seconds timeout) override;

private:
    std::string user_agent_;
};

} // namespace endec
