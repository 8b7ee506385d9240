#pragma once

#include <stdexcept>
#include <string>

namespace tus {

// Absolute or per-subject index outside [0, length).
class IndexOutOfRange : public std::out_of_range {
 public:
  explicit IndexOutOfRange(const std::string& what) : std::out_of_range(what) {}
};

// Sequential entry attempted on a view that is already full.
class CursorExhausted : public std::logic_error {
 public:
  explicit CursorExhausted(const std::string& what) : std::logic_error(what) {}
};

// Blueprint does not describe a valid category (size mismatch, duplicate names).
class ConfigurationInvalid : public std::invalid_argument {
 public:
  explicit ConfigurationInvalid(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace tus
