#include "app/Transport.hpp"
#include "app/Errors.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <memory>

namespace vigil::app {

static size_t write_cb(void* p, size_t s, size_t n, void* u) {
  static_cast<std::string*>(u)->append(static_cast<char*>(p), s * n);
  return s * n;
}

// Aborts the transfer once the caller's stop token fires
static int progress_cb(void* u, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  return static_cast<std::stop_token*>(u)->stop_requested() ? 1 : 0;
}

CurlTransport::CurlTransport(long timeout_seconds) : timeout_s_(timeout_seconds) {}

HttpResponse CurlTransport::post_json(const std::string& url, const std::string& body,
                                      const std::vector<std::string>& headers, std::stop_token st) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> c(curl_easy_init(), &curl_easy_cleanup);
  if (!c) throw TransportError("curl_easy_init failed");

  struct curl_slist* raw = nullptr;
  raw = curl_slist_append(raw, "Content-Type: application/json");
  for (const auto& h : headers) raw = curl_slist_append(raw, h.c_str());
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> hdrs(raw, &curl_slist_free_all);

  HttpResponse resp;
  curl_easy_setopt(c.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(c.get(), CURLOPT_HTTPHEADER, hdrs.get());
  curl_easy_setopt(c.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(c.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(c.get(), CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(c.get(), CURLOPT_TIMEOUT, timeout_s_);
  curl_easy_setopt(c.get(), CURLOPT_CONNECTTIMEOUT, std::min(timeout_s_, 10L));
  curl_easy_setopt(c.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(c.get(), CURLOPT_USERAGENT, "vigil-agent/1.0");
  curl_easy_setopt(c.get(), CURLOPT_XFERINFOFUNCTION, progress_cb);
  curl_easy_setopt(c.get(), CURLOPT_XFERINFODATA, &st);
  curl_easy_setopt(c.get(), CURLOPT_NOPROGRESS, 0L);

  auto rc = curl_easy_perform(c.get());
  if (rc != CURLE_OK) {
    throw TransportError(std::string("POST ") + url + ": " + curl_easy_strerror(rc));
  }
  curl_easy_getinfo(c.get(), CURLINFO_RESPONSE_CODE, &resp.status);
  return resp;
}

} // namespace vigil::app
