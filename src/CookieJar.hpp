#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "HttpResponse.hpp"

/// Session cookies accumulated from Set-Cookie headers. Cookies are merged
/// last-write-wins per name and never removed.
class CookieJar {
 public:
  CookieJar() = default;
  CookieJar(const CookieJar&) = delete;
  CookieJar& operator=(const CookieJar&) = delete;

  /// "session=abc; Path=/; HttpOnly" -> {"session", "abc"}
  static std::optional<std::pair<std::string, std::string>> ParseCookiePair(
    const std::string& set_cookie_line);

  void Set(const std::string& name, const std::string& value);

  /// Merge every Set-Cookie header of `response`; returns how many were taken
  size_t Merge(const HttpResponse& response);

  std::optional<std::string> Get(const std::string& name) const;

  /// "a=1; b=2", empty when the jar is empty
  std::string HeaderValue() const;

  size_t Size() const;

 private:
  mutable std::mutex m_;
  std::map<std::string, std::string> cookies_;
};
