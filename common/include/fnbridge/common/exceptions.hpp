#ifndef FNBRIDGE_COMMON_EXCEPTIONS_HPP
#define FNBRIDGE_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace fnbridge::common {

  struct FnBridgeException : std::runtime_error {

    FnBridgeException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : FnBridgeException {

    InvalidConfigurationError(const std::string& msg) : FnBridgeException(msg) {}
  };

  struct HTTPError : FnBridgeException {

    HTTPError(const std::string& msg) : FnBridgeException(msg) {}
  };

  struct FunctionNotFound : FnBridgeException {

    FunctionNotFound(const std::string& msg) : FnBridgeException(msg) {}
  };

  struct DecodingError : FnBridgeException {

    DecodingError(const std::string& msg) : FnBridgeException(msg) {}
  };

  struct EncodingError : FnBridgeException {

    EncodingError(const std::string& msg) : FnBridgeException(msg) {}
  };

  // The runtime could not deliver an error report to the control plane.
  struct ReportingError : FnBridgeException {

    ReportingError(const std::string& msg) : FnBridgeException(msg) {}
  };

} // namespace fnbridge::common

#endif
