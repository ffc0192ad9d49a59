#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace meshdispatch::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Transport and frame
  errors never leave the boundary that raised them.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// State machine guard violation. No mutation happened.
class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnitBusy : public std::runtime_error {
 public:
  explicit UnitBusy(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lost a compare-and-set race against a concurrent writer.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Non-fatal: the delivery exists, only its coordinates are missing.
class GeocodeError : public std::runtime_error {
 public:
  GeocodeError(const std::string& msg, std::int64_t delivery_id) : std::runtime_error(msg), delivery_id_(delivery_id) {
  }

  std::int64_t DeliveryId() const {
    return delivery_id_;
  }

 private:
  std::int64_t delivery_id_;
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedFrame : public std::runtime_error {
 public:
  explicit MalformedFrame(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace meshdispatch::util
