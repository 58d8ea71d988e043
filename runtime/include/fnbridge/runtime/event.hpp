#ifndef FNBRIDGE_RUNTIME_EVENT_HPP
#define FNBRIDGE_RUNTIME_EVENT_HPP

#include <map>
#include <optional>
#include <string>

namespace fnbridge::runtime {

  namespace headers {

    constexpr char REQUEST_ID[] = "Lambda-Runtime-Aws-Request-Id";
    constexpr char TRACE_ID[] = "Lambda-Runtime-Trace-Id";
    constexpr char CONTENT_TYPE[] = "Content-Type";
    constexpr char FUNCTION_DEFINITION[] = "function.definition";

  } // namespace headers

  struct InvocationEvent {

    using headers_t = std::map<std::string, std::string>;

    std::string request_id;

    std::optional<std::string> trace_id;

    std::string content_type;

    std::string body;

    // Header names are stored lower-case.
    headers_t headers;

    std::optional<std::string> header(std::string name) const;
  };

} // namespace fnbridge::runtime

#endif
