#pragma once

#include <stdexcept>
#include <string>

/// Base of every failure raised by the scraping, cache and scheduling layers.
class ScrapeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Missing or malformed configuration, e.g. credentials not configured.
class ConfigError : public ScrapeError {
 public:
  using ScrapeError::ScrapeError;
};

/// Network failure, timeout, or an HTTP failure during the login exchange.
class TransportError : public ScrapeError {
 public:
  using ScrapeError::ScrapeError;
};

/// The host answered the login but did not accept the credentials.
class InvalidCredentialsError : public ScrapeError {
 public:
  using ScrapeError::ScrapeError;
};

/// Non-success HTTP status or a redirect that cannot be resolved.
class FetchError : public ScrapeError {
 public:
  FetchError(const std::string& what, long status)
      : ScrapeError(what), status_{status} {
  }

  /// HTTP status of the response that could not be resolved; 0 for a
  /// redirect without Location
  long GetStatus() const noexcept {
    return status_;
  }

 private:
  long status_;
};

/// The parser could not turn a page into rows.
class ParseError : public ScrapeError {
 public:
  using ScrapeError::ScrapeError;
};
