#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Raised when an event cannot be turned into features (bad timestamp).
// Aborts the whole analysis request.
class FeatureExtractionError : public std::runtime_error {
public:
  explicit FeatureExtractionError(const std::string &msg)
      : std::runtime_error(msg) {}
};

// Raised when a batch is structurally unusable: not a list, a malformed
// element, or an unrecognized data category.
class InvalidBatchError : public std::runtime_error {
public:
  explicit InvalidBatchError(const std::string &msg)
      : std::runtime_error(msg) {}
};

#endif // ERRORS_HPP
