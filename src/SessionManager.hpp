#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include "Clock.hpp"
#include "CookieJar.hpp"
#include "Credentials.hpp"
#include "Transport.hpp"
#include "URL.hpp"

struct SessionOptions {
  std::string base_url{"https://www.tppcrpg.net"};
  std::string login_path{"/login.php"};
  // text only present on pages served to a logged-in user
  std::string login_marker{"Logout"};
  std::string user_field{"LoginID"};
  std::string pass_field{"NewPass"};
  std::chrono::seconds revalidate_window{std::chrono::minutes{10}};
};

/// Owns the credentials and the logged-in state of one client. The cookie
/// jar is shared with the client's response path.
class SessionManager {
 public:
  SessionManager(Credentials creds, SessionOptions options, CookieJar& jar,
                 Transport& transport, const Clock& clock);
  SessionManager(const SessionManager&) = delete;

  /// Skips the network when a non-forced login happens inside the
  /// re-validation window. Throws TransportError or InvalidCredentialsError.
  void Login(bool force = false);

  void Invalidate();

  bool IsValid() const;

  /// Time of the last successful login
  TimePoint GetAuthenticatedAt() const;

  /// Number of login exchanges sent to the host
  size_t GetLoginExchanges() const;

  const URL& GetLoginUrl() const {
    return login_url_;
  }

  /// True when a redirect target points at the login endpoint
  bool IsLoginLocation(const std::string& location) const;

 private:
  const Credentials creds_;
  const SessionOptions options_;
  const URL login_url_;
  CookieJar& jar_;
  Transport& transport_;
  const Clock& clock_;

  mutable std::mutex m_;
  bool valid_{false};
  TimePoint authenticated_at_{};
  size_t exchanges_{0};
};
