#pragma once
#include <stop_token>
#include <string>
#include <vector>

namespace vigil::app {

struct HttpResponse {
  long status{0};
  std::string body;

  [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
};

class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  // POSTs a JSON body. Throws TransportError when no HTTP response was
  // received (DNS, connect, timeout, cancelled through st).
  [[nodiscard]] virtual HttpResponse post_json(const std::string& url, const std::string& body,
                                               const std::vector<std::string>& headers,
                                               std::stop_token st) = 0;
};

// libcurl easy-interface transport. curl_global_init must have been called.
class CurlTransport : public IHttpTransport {
public:
  explicit CurlTransport(long timeout_seconds = 30);
  HttpResponse post_json(const std::string& url, const std::string& body,
                         const std::vector<std::string>& headers, std::stop_token st) override;
private:
  long timeout_s_;
};

} // namespace vigil::app
