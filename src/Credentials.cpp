#include "Credentials.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <cstdlib>

std::optional<Credentials> Credentials::FromEnvironment(
  const std::string& username_var, const std::string& password_var) {
  const char* user = std::getenv(username_var.c_str());
  const char* pass = std::getenv(password_var.c_str());
  if (!user || !*user || !pass || !*pass)
    return std::nullopt;
  return Credentials{user, pass};
}

Credentials Credentials::Require(const std::string& label,
                                 const std::string& username_var,
                                 const std::string& password_var) {
  auto creds = FromEnvironment(username_var, password_var);
  if (!creds) {
    logr::error << "[Credentials] " << username_var << "/" << password_var
                << " not configured for " << label;
    throw ConfigError("credentials not configured (" + username_var + " / " +
                      password_var + ")");
  }
  return *creds;
}
