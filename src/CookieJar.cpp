#include "CookieJar.hpp"
#include "Logger.hpp"

namespace {
std::string trim_copy(const std::string& s) {
  const auto l = s.find_first_not_of(" \t\r\n");
  if (l == std::string::npos)
    return {};
  const auto r = s.find_last_not_of(" \t\r\n");
  return s.substr(l, r - l + 1);
}
}  // namespace

std::optional<std::pair<std::string, std::string>> CookieJar::ParseCookiePair(
  const std::string& set_cookie_line) {
  const std::string first = set_cookie_line.substr(0, set_cookie_line.find(';'));
  const auto eq = first.find('=');
  if (eq == std::string::npos || eq == 0)
    return std::nullopt;
  std::string name = trim_copy(first.substr(0, eq));
  std::string value = trim_copy(first.substr(eq + 1));
  if (name.empty())
    return std::nullopt;
  return std::make_pair(std::move(name), std::move(value));
}

void CookieJar::Set(const std::string& name, const std::string& value) {
  std::lock_guard<std::mutex> lk(m_);
  cookies_[name] = value;
}

size_t CookieJar::Merge(const HttpResponse& response) {
  size_t taken = 0;
  for (const auto& line : response.GetHeaders("Set-Cookie")) {
    auto pair = ParseCookiePair(line);
    if (!pair) {
      logr::debug << "[CookieJar] skipping malformed Set-Cookie: " << line;
      continue;
    }
    Set(pair->first, pair->second);
    ++taken;
  }
  return taken;
}

std::optional<std::string> CookieJar::Get(const std::string& name) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = cookies_.find(name);
  if (it == cookies_.end())
    return std::nullopt;
  return it->second;
}

std::string CookieJar::HeaderValue() const {
  std::lock_guard<std::mutex> lk(m_);
  std::string header;
  for (const auto& [name, value] : cookies_) {
    if (!header.empty())
      header += "; ";
    header += name;
    header += '=';
    header += value;
  }
  return header;
}

size_t CookieJar::Size() const {
  std::lock_guard<std::mutex> lk(m_);
  return cookies_.size();
}
