#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

class URL {
 public:
  explicit URL(const std::string& url_string);

  URL Resolve(const URL& ref) const;
  URL Resolve(const std::string& ref) const;

  bool IsValid() const;
  std::string GetScheme() const;
  std::string GetHost() const;
  std::string GetPath() const;
  std::string GetQuery() const;

  std::string ToString() const;

  /// RFC 3986 percent-encoding of everything but unreserved characters
  static std::string Encode(const std::string& s);

  /// application/x-www-form-urlencoded body from ordered fields
  static std::string EncodeForm(
    const std::vector<std::pair<std::string, std::string>>& fields);

  // two URLs are equal if their canonical string forms match
  bool operator==(const URL& other) const {
    return ToString() == other.ToString();
  }
  bool operator!=(const URL& other) const {
    return !(*this == other);
  }

 private:
  std::string raw_url_;
  std::string scheme_, host_, path_, query_, fragment_;

  void Parse();
};

inline std::ostream& operator<<(std::ostream& os, const URL& u) {
  os << u.ToString();
  return os;
}
