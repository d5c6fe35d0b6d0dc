#pragma once

#include <stdexcept>

namespace brotbench {

// Malformed viewport, iteration bound or command-line value.
class InvalidArgument : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class ImageWriteError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace brotbench
