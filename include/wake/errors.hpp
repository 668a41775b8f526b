#pragma once

#include <stdexcept>
#include <string>

namespace wake {

// Bad configuration or definition supplied by a caller.
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

// Unknown alarm, condition or preset id.
class NotFoundError : public std::out_of_range {
public:
  explicit NotFoundError(const std::string& message) : std::out_of_range(message) {}
};

// Failure of an injected collaborator (sleep predictor, reading source, storage).
class CollaboratorError : public std::runtime_error {
public:
  explicit CollaboratorError(const std::string& message) : std::runtime_error(message) {}
};

class CollaboratorTimeoutError : public CollaboratorError {
public:
  explicit CollaboratorTimeoutError(const std::string& message) : CollaboratorError(message) {}
};

class CollaboratorUnavailableError : public CollaboratorError {
public:
  explicit CollaboratorUnavailableError(const std::string& message)
      : CollaboratorError(message) {}
};

} // namespace wake
