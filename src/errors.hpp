#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace paperback {

// Bad chunk size, unknown page format, or a record too long for any symbol.
class InvalidConfig : public std::runtime_error {
public:
  explicit InvalidConfig(const std::string& what) : std::runtime_error(what) {}
};

// assemble() called while chunks are still missing.
class IncompleteError : public std::runtime_error {
public:
  IncompleteError(const std::string& what,size_t missing) : std::runtime_error(what), missing_(missing) {}
  size_t missing() const { return missing_; }
private:
  size_t missing_;
};

} // namespace paperback
