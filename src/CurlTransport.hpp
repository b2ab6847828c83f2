#pragma once

#include <chrono>
#include <string>

#include "Transport.hpp"

/// libcurl-backed Transport. One easy handle per exchange; redirects are
/// never followed so the caller can inspect Location.
class CurlTransport : public Transport {
 public:
  CurlTransport(std::string user_agent, std::chrono::milliseconds timeout);

  HttpResponse Perform(const HttpRequest& request) override;

 private:
  static size_t WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                  void* userdata);
  static size_t WriteHeaderCallback(char* ptr, size_t size, size_t nmemb,
                                    void* userdata);

  std::string user_agent_;
  std::chrono::milliseconds timeout_;
};
