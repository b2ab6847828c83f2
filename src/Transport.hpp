#pragma once

#include <string>
#include <utility>
#include <vector>

#include "HttpResponse.hpp"

struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

/// Performs exactly one HTTP exchange. Implementations must not follow
/// redirects and must throw TransportError when no response was received.
class Transport {
 public:
  virtual ~Transport() = default;
  virtual HttpResponse Perform(const HttpRequest& request) = 0;
};
