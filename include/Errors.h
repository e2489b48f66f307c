#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

enum class MediaErrorKind {
    Timeout,
    Network,
    Unsupported
};

const char* to_string(MediaErrorKind kind);

// Base for every failure surfaced by acquisition and streaming.
class MediaError : public std::runtime_error {
  public:
    MediaError(MediaErrorKind kind, const std::string& message) : std::runtime_error(message), m_kind(kind) {}
    MediaErrorKind kind() const { return m_kind; }

  private:
    MediaErrorKind m_kind;
};

class TimeoutError : public MediaError {
  public:
    explicit TimeoutError(const std::string& message) : MediaError(MediaErrorKind::Timeout, message) {}
};

// status is the HTTP status code, or 0 when no response was received.
class NetworkError : public MediaError {
  public:
    NetworkError(int status, const std::string& message)
        : MediaError(MediaErrorKind::Network, message), m_status(status) {}
    int status() const { return m_status; }

  private:
    int m_status;
};

class UnsupportedFormatError : public MediaError {
  public:
    explicit UnsupportedFormatError(const std::string& message) : MediaError(MediaErrorKind::Unsupported, message) {}
};

#endif // ERRORS_H
