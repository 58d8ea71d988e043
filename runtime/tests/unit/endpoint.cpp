#include <fnbridge/common/exceptions.hpp>
#include <fnbridge/runtime/endpoint.hpp>
#include <fnbridge/runtime/event.hpp>

#include <gtest/gtest.h>

using namespace fnbridge::runtime;

TEST(RuntimeEndpoint, Urls)
{
  RuntimeEndpoint endpoint{"127.0.0.1:9001"};

  EXPECT_EQ(endpoint.host(), "127.0.0.1:9001");
  EXPECT_EQ(endpoint.address(), "http://127.0.0.1:9001");

  EXPECT_EQ(endpoint.next_path(), "/2018-06-01/runtime/invocation/next");
  EXPECT_EQ(endpoint.response_path("abc123"), "/2018-06-01/runtime/invocation/abc123/response");
  EXPECT_EQ(endpoint.error_path("abc123"), "/2018-06-01/runtime/invocation/abc123/error");

  EXPECT_EQ(endpoint.next_url(), "http://127.0.0.1:9001/2018-06-01/runtime/invocation/next");
  EXPECT_EQ(
      endpoint.response_url("abc123"),
      "http://127.0.0.1:9001/2018-06-01/runtime/invocation/abc123/response"
  );
  EXPECT_EQ(
      endpoint.error_url("abc123"),
      "http://127.0.0.1:9001/2018-06-01/runtime/invocation/abc123/error"
  );
}

TEST(RuntimeEndpoint, EmptyAddress)
{
  EXPECT_THROW(RuntimeEndpoint{""}, fnbridge::common::InvalidConfigurationError);
}

TEST(RuntimeEndpoint, UserAgent)
{
  auto agent = RuntimeEndpoint::user_agent("1.2.0");

  EXPECT_EQ(agent.rfind("fnbridge/", 0), 0);
  EXPECT_NE(agent.find(RuntimeEndpoint::platform_version()), std::string::npos);
  EXPECT_EQ(agent.substr(agent.size() - 6), "-1.2.0");
}

TEST(InvocationEvent, HeaderLookupIgnoresCase)
{
  InvocationEvent event;
  event.headers["lambda-runtime-trace-id"] = "Root=1-abc";

  ASSERT_TRUE(event.header(headers::TRACE_ID).has_value());
  EXPECT_EQ(event.header(headers::TRACE_ID).value(), "Root=1-abc");
  EXPECT_FALSE(event.header(headers::FUNCTION_DEFINITION).has_value());
}
