#pragma once

#include <future>
#include <string>
#include <utility>
#include <vector>

#include "Clock.hpp"
#include "CookieJar.hpp"
#include "Credentials.hpp"
#include "Metrics.hpp"
#include "RequestSerializer.hpp"
#include "SessionManager.hpp"
#include "Transport.hpp"
#include "URL.hpp"

/// Logged-in page access to one site. Every operation, logins included,
/// runs through one RequestSerializer, so at most one request is in flight
/// per client. A redirect to the login page triggers a single forced
/// re-login and one replay of the original request.
class ScrapingClient {
 public:
  static constexpr int kMaxRedirects = 5;

  /// `metrics`, when given, counts each exchange as "ok" or "error"
  ScrapingClient(Credentials creds, SessionOptions options,
                 Transport& transport, const Clock& clock,
                 Metrics* metrics = nullptr);
  ScrapingClient(const ScrapingClient&) = delete;
  ScrapingClient& operator=(const ScrapingClient&) = delete;

  /// GET; `path_or_url` is resolved against the base URL.
  /// Throws FetchError, TransportError or InvalidCredentialsError.
  std::string FetchPage(const std::string& path_or_url);
  std::future<std::string> FetchPageAsync(const std::string& path_or_url);

  /// POST of an application/x-www-form-urlencoded body
  std::string SubmitForm(const std::string& path_or_url,
                         const std::string& form_body);
  std::string SubmitForm(
    const std::string& path_or_url,
    const std::vector<std::pair<std::string, std::string>>& fields);
  std::future<std::string> SubmitFormAsync(const std::string& path_or_url,
                                           const std::string& form_body);

  /// Serialized login, e.g. to validate credentials at startup
  void Login(bool force = false);

  const CookieJar& GetCookies() const {
    return jar_;
  }
  const SessionManager& GetSession() const {
    return session_;
  }

 private:
  std::future<std::string> Submit(HttpRequest request);
  std::string Execute(const HttpRequest& request);
  HttpResponse Send(const HttpRequest& request);
  void Count(const std::string& method, const std::string& status);
  std::string Resolve(const HttpResponse& response, const HttpRequest& request,
                      bool allow_login_retry, int hops);
  void RequireOffWorker() const;

  const URL base_;
  CookieJar jar_;
  Transport& transport_;
  Metrics* metrics_;
  SessionManager session_;
  // declared last: its worker is joined before the members above go away
  RequestSerializer serializer_;
};
