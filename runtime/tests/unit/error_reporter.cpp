#include <fnbridge/common/exceptions.hpp>
#include <fnbridge/runtime/error_reporter.hpp>

#include "mocks.hpp"

#include <json/reader.h>
#include <json/value.h>

#include <gtest/gtest.h>

namespace {

  Json::Value parse(const std::string& body)
  {
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
    EXPECT_TRUE(reader->parse(body.data(), body.data() + body.size(), &json, &errors)) << errors;
    return json;
  }

  std::exception_ptr capture(const std::function<void()>& f)
  {
    try {
      f();
    } catch (...) {
      return std::current_exception();
    }
    return nullptr;
  }

} // namespace

TEST(ErrorReport, StandardException)
{
  auto failure = capture([] { throw std::invalid_argument{"negative input"}; });
  auto report = ErrorReport::from(failure);

  EXPECT_EQ(report.error_message, "negative input");
  EXPECT_EQ(report.error_type, "invalid_argument");
  EXPECT_NE(report.stack_trace.find("invalid_argument: negative input"), std::string::npos);
}

TEST(ErrorReport, NestedFailure)
{
  auto failure = capture([] {
    try {
      throw std::runtime_error{"unexpected token"};
    } catch (...) {
      std::throw_with_nested(fnbridge::common::DecodingError{"Could not decode event"});
    }
  });
  auto report = ErrorReport::from(failure);

  EXPECT_EQ(report.error_message, "Could not decode event");
  EXPECT_EQ(report.error_type, "DecodingError");
  EXPECT_NE(report.stack_trace.find("DecodingError: Could not decode event"), std::string::npos);
  EXPECT_NE(
      report.stack_trace.find("caused by runtime_error: unexpected token"), std::string::npos
  );
}

TEST(ErrorReport, NonStandardException)
{
  auto failure = capture([] { throw 42; });
  auto report = ErrorReport::from(failure);

  EXPECT_EQ(report.error_message, "");
  EXPECT_EQ(report.error_type, ErrorReport::UNKNOWN_ERROR);
  EXPECT_FALSE(report.stack_trace.empty());

  // All three keys are present even without a message.
  auto json = parse(report.serialize());
  ASSERT_TRUE(json.isMember("errorMessage"));
  ASSERT_TRUE(json.isMember("errorType"));
  ASSERT_TRUE(json.isMember("stackTrace"));
  EXPECT_EQ(json["errorMessage"].asString(), "");
  EXPECT_EQ(json["errorType"].asString(), "UnknownError");
}

TEST(ErrorReport, Serialize)
{
  ErrorReport report{"quote \" and newline \n", "FunctionNotFound", "trace"};
  auto json = parse(report.serialize());

  EXPECT_EQ(json.size(), 3);
  EXPECT_EQ(json["errorMessage"].asString(), "quote \" and newline \n");
  EXPECT_EQ(json["errorType"].asString(), "FunctionNotFound");
  EXPECT_EQ(json["stackTrace"].asString(), "trace");
}

TEST(ErrorReporter, Report)
{
  MockTransport transport;
  ErrorReporter reporter{transport};
  CancellationToken token;

  std::string body;
  EXPECT_CALL(transport, report_error("abc123", testing::_, testing::_))
      .WillOnce(testing::SaveArg<1>(&body));

  auto failure = capture([] { throw fnbridge::common::FunctionNotFound{"no function"}; });
  reporter.report("abc123", failure, token);

  auto json = parse(body);
  EXPECT_EQ(json["errorMessage"].asString(), "no function");
  EXPECT_EQ(json["errorType"].asString(), "FunctionNotFound");
  EXPECT_FALSE(json["stackTrace"].asString().empty());
}

TEST(ErrorReporter, TransportFailureEscalates)
{
  MockTransport transport;
  ErrorReporter reporter{transport};
  CancellationToken token;

  EXPECT_CALL(transport, report_error("abc123", testing::_, testing::_))
      .WillOnce(testing::Throw(fnbridge::common::HTTPError{"connection reset"}))
      .WillOnce(testing::Throw(fnbridge::common::ReportingError{"status 500"}));

  auto failure = capture([] { throw std::runtime_error{"boom"}; });
  EXPECT_THROW(reporter.report("abc123", failure, token), fnbridge::common::ReportingError);
  EXPECT_THROW(reporter.report("abc123", failure, token), fnbridge::common::ReportingError);
}
