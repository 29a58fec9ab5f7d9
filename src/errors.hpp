// errors.hpp

#pragma once
#include <stdexcept>

// Malformed or missing request fields. The message names the offending
// field and is returned to the caller as is.
class ValidationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The addressed peer is not a member of the addressed group.
class NotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Storage or serialization fault. Logged with detail, reported generically.
class InternalError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
