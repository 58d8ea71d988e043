#ifndef FNBRIDGE_RUNTIME_ERROR_REPORTER_HPP
#define FNBRIDGE_RUNTIME_ERROR_REPORTER_HPP

#include <fnbridge/runtime/state.hpp>
#include <fnbridge/runtime/transport.hpp>

#include <exception>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace fnbridge::runtime {

  struct ErrorReport {

    static constexpr char UNKNOWN_ERROR[] = "UnknownError";

    std::string error_message;
    std::string error_type;
    std::string stack_trace;

    static ErrorReport from(std::exception_ptr failure);

    // {"errorMessage": ..., "errorType": ..., "stackTrace": ...}
    std::string serialize() const;
  };

  struct ErrorReporter {

    ErrorReporter(Transport& transport);

    // Throws common::ReportingError when the report cannot be delivered.
    void report(
        const std::string& request_id, std::exception_ptr failure, const CancellationToken& token
    );

  private:
    Transport& _transport;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace fnbridge::runtime

#endif
