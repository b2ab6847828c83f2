#include "CurlTransport.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace {
struct EasyDeleter {
  void operator()(CURL* c) const {
    curl_easy_cleanup(c);
  }
};
struct SlistDeleter {
  void operator()(curl_slist* l) const {
    curl_slist_free_all(l);
  }
};
}  // namespace

CurlTransport::CurlTransport(std::string user_agent,
                             std::chrono::milliseconds timeout)
    : user_agent_{std::move(user_agent)}, timeout_{timeout} {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlTransport::Perform(const HttpRequest& request) {
  std::unique_ptr<CURL, EasyDeleter> curl{curl_easy_init()};
  if (!curl) {
    throw TransportError("[CurlTransport] failed to init CURL");
  }
  CURL* h = curl.get();

  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);  // thread-safe timeouts on *nix
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, 10000L);
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);

  curl_easy_setopt(h, CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());

  // Location is inspected by the client; never follow it here
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);

  curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);

  std::unique_ptr<curl_slist, SlistDeleter> headers;
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    curl_slist* next = curl_slist_append(headers.get(), line.c_str());
    if (!next) {
      throw TransportError("[CurlTransport] failed to build header list");
    }
    headers.release();
    headers.reset(next);
  }
  if (headers) {
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  }

  if (request.method == "POST") {
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  } else if (request.method != "GET") {
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }

  HttpResponse resp;

  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteBodyCallback);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp);
  curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, WriteHeaderCallback);
  curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp);

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

  logr::debug << "[CurlTransport] " << request.method << " " << request.url;

  CURLcode code = curl_easy_perform(h);

  if (code != CURLE_OK) {
    std::string what = "[CurlTransport] " + request.method + " " +
                       request.url + ": " + curl_easy_strerror(code);
    if (errbuf[0])
      what += std::string(" (") + errbuf + ")";
    logr::warning << what;
    throw TransportError(what);
  }

  long http_code = 0;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_code);
  resp.SetStatusCode(http_code);

  logr::debug << "[CurlTransport] HTTP " << http_code << " " << request.url;
  return resp;
}

size_t CurlTransport::WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                        void* userdata) {
  auto* resp = static_cast<HttpResponse*>(userdata);
  resp->AppendBody(ptr, size * nmemb);
  return size * nmemb;
}

size_t CurlTransport::WriteHeaderCallback(char* ptr, size_t size,
                                          size_t nmemb, void* userdata) {
  auto* resp = static_cast<HttpResponse*>(userdata);
  // ptr may include the "\r\n" at the end
  std::string line(ptr, size * nmemb);
  resp->AddHeaderLine(line);
  return size * nmemb;
}
