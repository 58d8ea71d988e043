#include <fnbridge/runtime/error_reporter.hpp>

#include <fnbridge/common/exceptions.hpp>
#include <fnbridge/common/util.hpp>

#include <json/value.h>
#include <json/writer.h>

#include <fmt/format.h>

namespace fnbridge::runtime {

  namespace {

    // One line per exception, outermost first, following std::nested_exception.
    void describe_chain(const std::exception& exc, std::string& trace, int depth)
    {
      trace += fmt::format(
          "{}{}: {}\n", depth == 0 ? "" : "  caused by ",
          common::util::short_type_name(typeid(exc)), exc.what()
      );

      try {
        std::rethrow_if_nested(exc);
      } catch (const std::exception& nested) {
        describe_chain(nested, trace, depth + 1);
      } catch (...) {
        trace += fmt::format("  caused by {}\n", ErrorReport::UNKNOWN_ERROR);
      }
    }

  } // namespace

  ErrorReport ErrorReport::from(std::exception_ptr failure)
  {
    ErrorReport report;
    try {
      std::rethrow_exception(failure);
    } catch (const std::exception& exc) {
      report.error_message = exc.what();
      report.error_type = common::util::short_type_name(typeid(exc));
      describe_chain(exc, report.stack_trace, 0);
    } catch (...) {
      report.error_message = "";
      report.error_type = UNKNOWN_ERROR;
      report.stack_trace = fmt::format("{}: non-standard exception\n", UNKNOWN_ERROR);
    }
    return report;
  }

  std::string ErrorReport::serialize() const
  {
    Json::Value json;
    json["errorMessage"] = error_message;
    json["errorType"] = error_type;
    json["stackTrace"] = stack_trace;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, json);
  }

  ErrorReporter::ErrorReporter(Transport& transport) : _transport(transport)
  {
    _logger = common::util::create_logger("ErrorReporter");
  }

  void ErrorReporter::report(
      const std::string& request_id, std::exception_ptr failure, const CancellationToken& token
  )
  {
    auto report = ErrorReport::from(failure);
    _logger->error(
        "Invocation of request {} failed with {}: {}", request_id, report.error_type,
        report.error_message
    );
    SPDLOG_LOGGER_DEBUG(_logger, "Stack trace of request {}:\n{}", request_id, report.stack_trace);

    try {
      _transport.report_error(request_id, report.serialize(), token);
    } catch (const common::ReportingError&) {
      throw;
    } catch (const std::exception& exc) {
      std::throw_with_nested(common::ReportingError{
          fmt::format("Failed to report error of request {}: {}", request_id, exc.what())});
    }
  }

} // namespace fnbridge::runtime
