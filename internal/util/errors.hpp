#pragma once

#include <stdexcept>
#include <string>

namespace mprisrelay::util {

/*
  Errors raised by the pairing and relay services. The gRPC adapters map
  each to a status code (see grpc/grpc_error.hpp); their messages reach
  the remote client, so they never carry key material.
*/

// Unknown player, pairing session or trust record.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Message out of order for the pairing or relay exchange.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Pairing session limit reached.
class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller could not prove it holds a valid trust record.
class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller is known but refused (e.g. blocked peer).
class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Shutting down, or the session bus or credential store is unusable.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace mprisrelay::util
