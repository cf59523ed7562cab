#include "net/CurlTransport.hpp"

#include <curl/curl.h>

#include <memory>

namespace skynode::net {

CurlGlobal::CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) {}

CurlGlobal::~CurlGlobal() {
  if (ok_) curl_global_cleanup();
}

namespace {

size_t discard_cb(char*, size_t size, size_t nmemb, void*) { return size * nmemb; }

struct EasyDeleter { void operator()(CURL* c) const { curl_easy_cleanup(c); } };
struct SlistDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };

} // namespace

util::Result<void> CurlTransport::post_notification(const model::Node& peer, const std::string& body,
                                                    std::chrono::milliseconds timeout) {
  std::unique_ptr<CURL, EasyDeleter> c(curl_easy_init());
  if (!c) return util::fail(util::Errc::PeerUnreachable, "curl_easy_init failed");

  curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  const std::string url = peer.api_url() + "/alerts/notify";
  const long ms = static_cast<long>(timeout.count());

  curl_easy_setopt(c.get(), CURLOPT_URL,               url.c_str());
  curl_easy_setopt(c.get(), CURLOPT_POST,              1L);
  curl_easy_setopt(c.get(), CURLOPT_POSTFIELDS,        body.c_str());
  curl_easy_setopt(c.get(), CURLOPT_POSTFIELDSIZE,     static_cast<long>(body.size()));
  curl_easy_setopt(c.get(), CURLOPT_HTTPHEADER,        headers.get());
  curl_easy_setopt(c.get(), CURLOPT_TIMEOUT_MS,        ms);
  curl_easy_setopt(c.get(), CURLOPT_CONNECTTIMEOUT_MS, ms);
  curl_easy_setopt(c.get(), CURLOPT_NOSIGNAL,          1L);  // worker threads; no SIGALRM
  curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION,     discard_cb);

  CURLcode res = curl_easy_perform(c.get());
  if (res == CURLE_OPERATION_TIMEDOUT)
    return util::fail(util::Errc::PeerTimeout, url + ": no response within " + std::to_string(timeout.count()) + "ms");
  if (res != CURLE_OK)
    return util::fail(util::Errc::PeerUnreachable, url + ": " + curl_easy_strerror(res));

  long http_code = 0;
  curl_easy_getinfo(c.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300)
    return util::fail(util::Errc::PeerUnreachable, url + ": HTTP " + std::to_string(http_code));
  return {};
}

} // namespace skynode::net
