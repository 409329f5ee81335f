#ifndef KEYREG_UTIL_NAMED_RUNTIME_ERROR_HPP
#define KEYREG_UTIL_NAMED_RUNTIME_ERROR_HPP

#include <stdexcept>

namespace keyreg {

// Common base of every exception thrown by keyreg.
class error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

template <typename>
class named_runtime_error : public error {
public:
  using error::error;
};

} // namespace keyreg

#endif
