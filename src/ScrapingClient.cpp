#include "ScrapingClient.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <stdexcept>

ScrapingClient::ScrapingClient(Credentials creds, SessionOptions options,
                               Transport& transport, const Clock& clock,
                               Metrics* metrics)
    : base_{options.base_url},
      transport_{transport},
      metrics_{metrics},
      session_{std::move(creds), std::move(options), jar_, transport, clock} {
  if (!base_.IsValid()) {
    throw ConfigError("invalid base URL: " + base_.ToString());
  }
}

std::string ScrapingClient::FetchPage(const std::string& path_or_url) {
  RequireOffWorker();
  return FetchPageAsync(path_or_url).get();
}

std::future<std::string> ScrapingClient::FetchPageAsync(
  const std::string& path_or_url) {
  HttpRequest req;
  req.method = "GET";
  req.url = base_.Resolve(path_or_url).ToString();
  return Submit(std::move(req));
}

std::string ScrapingClient::SubmitForm(const std::string& path_or_url,
                                       const std::string& form_body) {
  RequireOffWorker();
  return SubmitFormAsync(path_or_url, form_body).get();
}

std::string ScrapingClient::SubmitForm(
  const std::string& path_or_url,
  const std::vector<std::pair<std::string, std::string>>& fields) {
  return SubmitForm(path_or_url, URL::EncodeForm(fields));
}

std::future<std::string> ScrapingClient::SubmitFormAsync(
  const std::string& path_or_url, const std::string& form_body) {
  HttpRequest req;
  req.method = "POST";
  req.url = base_.Resolve(path_or_url).ToString();
  req.headers.emplace_back("Content-Type",
                           "application/x-www-form-urlencoded");
  req.body = form_body;
  return Submit(std::move(req));
}

void ScrapingClient::Login(bool force) {
  RequireOffWorker();
  serializer_.Run([this, force] { session_.Login(force); }).get();
}

std::future<std::string> ScrapingClient::Submit(HttpRequest request) {
  return serializer_.Run(
    [this, req = std::move(request)]() { return Execute(req); });
}

std::string ScrapingClient::Execute(const HttpRequest& request) {
  session_.Login();
  HttpResponse resp = Send(request);
  return Resolve(resp, request, true, 0);
}

HttpResponse ScrapingClient::Send(const HttpRequest& request) {
  HttpRequest out = request;
  out.headers.erase(
    std::remove_if(out.headers.begin(), out.headers.end(),
                   [](const auto& h) { return h.first == "Cookie"; }),
    out.headers.end());
  if (auto cookie = jar_.HeaderValue(); !cookie.empty()) {
    out.headers.emplace_back("Cookie", cookie);
  }

  HttpResponse resp;
  try {
    resp = transport_.Perform(out);
  } catch (const TransportError&) {
    Count(out.method, "error");
    throw;
  }
  Count(out.method, "ok");
  jar_.Merge(resp);
  return resp;
}

void ScrapingClient::Count(const std::string& method,
                           const std::string& status) {
  if (!metrics_)
    return;
  metrics_->Increment("rpg.fetch", {{"method", method}, {"status", status}});
  metrics_->IncrementExternalFetch("rpg", status);
}

std::string ScrapingClient::Resolve(const HttpResponse& response,
                                    const HttpRequest& request,
                                    bool allow_login_retry, int hops) {
  const long status = response.GetStatusCode();

  if (response.IsOkay())
    return response.GetBody();

  if (response.IsRedirect()) {
    auto location = response.GetLocation();
    if (!location) {
      logr::error << "[ScrapingClient] redirect without Location: HTTP "
                  << status << " " << request.url;
      throw FetchError("fetch failed (HTTP " + std::to_string(status) +
                         ", redirect without Location)",
                       0);
    }

    if (session_.IsLoginLocation(*location)) {
      if (!allow_login_retry) {
        logr::error << "[ScrapingClient] still redirected to login after "
                       "re-login: "
                    << request.url;
        throw FetchError("fetch failed (HTTP " + std::to_string(status) +
                           ", login required after re-login)",
                         status);
      }
      logr::info << "[ScrapingClient] session expired, logging in again";
      session_.Login(true);
      HttpResponse retry = Send(request);
      return Resolve(retry, request, false, hops);
    }

    if (hops >= kMaxRedirects) {
      logr::error << "[ScrapingClient] too many redirects: " << request.url;
      throw FetchError("fetch failed (HTTP " + std::to_string(status) +
                         ", too many redirects)",
                       status);
    }

    HttpRequest next;
    next.method = "GET";
    next.url = URL(request.url).Resolve(*location).ToString();
    logr::debug << "[ScrapingClient] following redirect to " << next.url;
    HttpResponse followed = Send(next);
    return Resolve(followed, next, false, hops + 1);
  }

  logr::error << "[ScrapingClient] HTTP " << status << " " << request.url;
  throw FetchError("fetch failed (HTTP " + std::to_string(status) + ")",
                   status);
}

void ScrapingClient::RequireOffWorker() const {
  if (serializer_.OnWorker()) {
    throw std::logic_error(
      "ScrapingClient: blocking call from inside a serialized task");
  }
}
