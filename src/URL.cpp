#include "URL.hpp"
#include "Logger.hpp"

#include <cctype>
#include <regex>
#include <string_view>

namespace {
// join and normalize "/a/b/../c" -> "/a/c"
std::string normalize_path(const std::string& raw) {
  std::vector<std::string> parts;
  for (size_t i = 0, n = raw.size(); i < n;) {
    size_t j = raw.find('/', i);
    if (j == std::string::npos)
      j = n;
    std::string seg = raw.substr(i, j - i);
    if (seg == "..") {
      if (!parts.empty())
        parts.pop_back();
    } else if (seg != "" && seg != ".") {
      parts.push_back(seg);
    }
    i = j + 1;
  }
  std::string out = "/";
  for (size_t k = 0; k < parts.size(); ++k) {
    out += parts[k];
    if (k + 1 < parts.size())
      out += "/";
  }
  // keep a trailing slash: "/dir/" stays a directory
  if (!raw.empty() && raw.back() == '/' && out.size() > 1)
    out += "/";
  return out;
}
}  // namespace

URL::URL(const std::string& url_string) : raw_url_(url_string) {
  Parse();
}

URL URL::Resolve(const URL& ref) const {
  return Resolve(ref.ToString());
}

URL URL::Resolve(const std::string& ref) const {
  // Absolute: starts with a scheme; "?next=https://..." does not count
  static const std::regex scheme_re(R"(^[A-Za-z][A-Za-z0-9+.\-]*:)");
  if (std::regex_search(ref, scheme_re)) {
    return URL(ref);
  }

  // Protocol-relative: inherit base scheme
  if (ref.size() >= 2 && ref[0] == '/' && ref[1] == '/') {
    return URL(scheme_ + ":" + ref);
  }

  std::string_view sv = ref;
  std::string frag, ref_query, ref_path;

  if (auto h = sv.find('#'); h != std::string::npos) {
    frag.assign(sv.substr(h + 1));
    sv = sv.substr(0, h);
  }
  if (auto q = sv.find('?'); q != std::string::npos) {
    ref_query.assign(sv.substr(q));  // keep leading '?'
    ref_path.assign(sv.substr(0, q));
  } else {
    ref_path.assign(sv);
  }

  const std::string origin = scheme_.empty() ? "" : (scheme_ + "://" + host_);

  std::string path;
  if (ref_path.empty()) {
    path = path_.empty() ? "/" : path_;
  } else if (ref_path[0] == '/') {
    path = normalize_path(ref_path);
  } else {
    const std::string base_dir =
      path_.empty() ? "/" : path_.substr(0, path_.find_last_of('/') + 1);
    path = normalize_path(base_dir + ref_path);
  }

  // Query: ref wins; else inherit only when path is empty
  const std::string query = !ref_query.empty() ? ref_query
                            : ref_path.empty() ? query_
                                               : "";

  return URL(origin + path + query + (frag.empty() ? "" : "#" + frag));
}

void URL::Parse() {
  // group 2 = scheme, 3 = host[:port], 4 = path, 5 = query with '?',
  // 6 = fragment with '#'
  static const std::regex url_regex(
    R"(^((https?)://)?([^/?#]+)(/[^?#]*)?(\?[^#]*)?(#.*)?$)",
    std::regex::icase);
  std::smatch match;
  if (std::regex_match(raw_url_, match, url_regex)) {
    scheme_ = match[2].matched ? match[2].str() : "";
    for (auto& c : scheme_)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    host_ = match[3];
    path_ = match[4].matched ? match[4].str() : "";
    query_ = match[5].matched ? match[5].str() : "";
    fragment_ = match[6].matched ? match[6].str().substr(1) : "";
  } else {
    logr::debug << "[URL] not an absolute URL: " << raw_url_;
  }
}

bool URL::IsValid() const {
  return !scheme_.empty() && !host_.empty();
}

std::string URL::GetScheme() const {
  return scheme_;
}

std::string URL::GetHost() const {
  return host_;
}

std::string URL::GetPath() const {
  return path_;
}

std::string URL::GetQuery() const {
  return query_;
}

std::string URL::ToString() const {
  std::string url;

  if (!scheme_.empty()) {
    url += scheme_;
    url += "://";
  }

  url += host_;

  if (!path_.empty()) {
    if (path_[0] != '/') {
      url += '/';
    }
    url += path_;
  }

  url += query_;

  if (!fragment_.empty()) {
    url += '#';
    url += fragment_;
  }

  return url;
}

std::string URL::Encode(const std::string& s) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

std::string URL::EncodeForm(
  const std::vector<std::pair<std::string, std::string>>& fields) {
  std::string body;
  for (const auto& [key, value] : fields) {
    if (!body.empty())
      body += '&';
    body += Encode(key);
    body += '=';
    body += Encode(value);
  }
  return body;
}
