#include "SessionManager.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>

namespace {
std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}
}  // namespace

SessionManager::SessionManager(Credentials creds, SessionOptions options,
                               CookieJar& jar, Transport& transport,
                               const Clock& clock)
    : creds_{std::move(creds)},
      options_{std::move(options)},
      login_url_{URL(options_.base_url).Resolve(options_.login_path)},
      jar_{jar},
      transport_{transport},
      clock_{clock} {
  if (creds_.username.empty() || creds_.password.empty()) {
    throw ConfigError("credentials not configured");
  }
}

void SessionManager::Login(bool force) {
  {
    std::lock_guard<std::mutex> lk(m_);
    if (!force && valid_ &&
        clock_.Now() - authenticated_at_ < options_.revalidate_window) {
      return;
    }
    ++exchanges_;
  }

  HttpRequest req;
  req.method = "POST";
  req.url = login_url_.ToString();
  req.headers.emplace_back("Content-Type",
                           "application/x-www-form-urlencoded");
  if (auto cookie = jar_.HeaderValue(); !cookie.empty()) {
    req.headers.emplace_back("Cookie", cookie);
  }
  req.body = URL::EncodeForm(
    {{options_.user_field, creds_.username},
     {options_.pass_field, creds_.password}});

  logr::debug << "[SessionManager] login" << (force ? " (forced)" : "")
              << " as " << creds_.username;

  HttpResponse resp;
  try {
    resp = transport_.Perform(req);
  } catch (const TransportError&) {
    Invalidate();
    logr::error << "[SessionManager] login transport failure";
    throw;
  }

  // diagnostic cookies from a failed login still matter for the retry
  jar_.Merge(resp);

  const long status = resp.GetStatusCode();
  if (status != 200 && status != 302) {
    Invalidate();
    logr::error << "[SessionManager] login failed: HTTP " << status;
    throw TransportError("login failed (HTTP " + std::to_string(status) +
                         ")");
  }

  const auto& body = resp.GetBody();
  if (!body.empty() && body.find(options_.login_marker) == std::string::npos) {
    Invalidate();
    logr::error << "[SessionManager] login rejected: invalid credentials for "
                << creds_.username;
    throw InvalidCredentialsError(
      "login rejected (invalid username/password)");
  }

  std::lock_guard<std::mutex> lk(m_);
  valid_ = true;
  authenticated_at_ = clock_.Now();
  logr::info << "[SessionManager] logged in as " << creds_.username;
}

void SessionManager::Invalidate() {
  std::lock_guard<std::mutex> lk(m_);
  valid_ = false;
}

bool SessionManager::IsValid() const {
  std::lock_guard<std::mutex> lk(m_);
  return valid_;
}

TimePoint SessionManager::GetAuthenticatedAt() const {
  std::lock_guard<std::mutex> lk(m_);
  return authenticated_at_;
}

size_t SessionManager::GetLoginExchanges() const {
  std::lock_guard<std::mutex> lk(m_);
  return exchanges_;
}

bool SessionManager::IsLoginLocation(const std::string& location) const {
  // "https://host/login.php?next=..." and "/login.php" both count
  const std::string path = login_url_.GetPath();
  const std::string page = path.substr(path.find_last_of('/') + 1);
  if (page.empty())
    return false;
  const URL target = login_url_.Resolve(location);
  return lowercase(target.GetPath()).find(lowercase(page)) !=
         std::string::npos;
}
