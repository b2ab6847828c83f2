#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

class HttpResponse {
 public:
  HttpResponse() = default;
  explicit HttpResponse(long status, std::string body = {})
      : body_{std::move(body)}, status_code_{status} {
  }

  /// Parse one raw header line (e.g. "Content-Type: text/html"). A status
  /// line ("HTTP/1.1 302 Found") starts a new header block, so only the
  /// headers of the final response are kept.
  void AddHeaderLine(const std::string& line);

  /// Append one header without parsing
  void AddHeader(std::string name, std::string value);

  /// Append to the response body
  void AppendBody(const char* data, size_t len);

  /// Return the first header value matching `key` (case-insensitive)
  std::optional<std::string> GetHeader(const std::string& key) const;

  /// Return all header values matching `key` (case-insensitive)
  std::vector<std::string> GetHeaders(const std::string& key) const;

  /// All parsed header (name,value) pairs in order received
  const std::vector<std::pair<std::string, std::string>>& GetHeaders() const;

  /// The accumulated body text
  const std::string& GetBody() const;

  void SetStatusCode(long http_status);
  long GetStatusCode() const;

  /// The Location header, if any
  std::optional<std::string> GetLocation() const;

  /// HTTP status code is 200 to 299
  bool IsOkay() const;

  /// HTTP status code is 300 to 399
  bool IsRedirect() const;

 private:
  std::vector<std::pair<std::string, std::string>> headers_;
  std::string body_;
  long status_code_{0};
};
