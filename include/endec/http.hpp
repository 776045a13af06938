/**
 * @file http.hpp
 * @brief Minimal HTTP POST seam used by the webhook-style sinks.
 *
 * The production client is CurlHttpClient (http_client.hpp). Implementations
 * report transport failures in HttpResponse::error and never throw.
 */
#ifndef ENDEC_HTTP_HPP
#define ENDEC_HTTP_HPP

#include <chrono>
#include <string>

namespace endec {

struct HttpResponse {
  long status = 0;          ///< 0 when no response was received
  std::string body;
  std::string error;        ///< transport error text, empty on success

  bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

class IHttpClient {
public:
  virtual ~IHttpClient() = default;
  virtual HttpResponse post_json(const std::string& url,
                                 const std::string& body,
                                 std::chrono::seconds timeout) = 0;
};

} // namespace endec

#endif // ENDEC_HTTP_HPP
