#pragma once

#include <stdexcept>
#include <string>

namespace callpop {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Invalid or missing settings. Never retried.
class ConfigError : public Error {
public:
  using Error::Error;
};

// The server refused the login.
class AuthError : public ConfigError {
public:
  using ConfigError::ConfigError;
};

enum class ActionErrc { Timeout, Rejected, Disconnected, NotFound };

const char* to_string(ActionErrc code);

// Failure of one action, reported only to the caller that submitted it.
class ActionError : public Error {
public:
  ActionError(ActionErrc code, const std::string& what)
      : Error(std::string(to_string(code)) + ": " + what), code_(code) {}

  ActionErrc code() const { return code_; }

private:
  ActionErrc code_;
};

}  // namespace callpop
