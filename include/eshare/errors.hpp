#ifndef ESHARE_ERRORS_HPP
#define ESHARE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace eshare {

// Invalid construction argument: negative replay, negative timeouts and the
// like. Thrown synchronously, before anything is launched.
class configuration_error : public std::invalid_argument {
public:
  explicit configuration_error(const std::string &what)
      : std::invalid_argument(what) {}
};

// A sharing session could not produce what the caller waits for.
class sharing_error : public std::runtime_error {
public:
  explicit sharing_error(const std::string &what) : std::runtime_error(what) {}
};

} // namespace eshare

#endif // ESHARE_ERRORS_HPP
