#pragma once
#include <stdexcept>
#include <string>

// Broker unreachable or session lost. Recovered by reconnecting with backoff.
class ConnectError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Publish not confirmed; the message must be assumed not stored.
class PublishError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Truncated, malformed or version-mismatched payload. Never retried.
class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class DetectionError : public std::runtime_error {
public:
  enum class Kind { Transient, Permanent };

  DetectionError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

  Kind kind() const { return kind_; }
  bool transient() const { return kind_ == Kind::Transient; }

private:
  Kind kind_;
};

class CaptureError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
