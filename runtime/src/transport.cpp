#include <fnbridge/runtime/transport.hpp>

#include <fnbridge/common/exceptions.hpp>
#include <fnbridge/common/util.hpp>
#include <fnbridge/runtime/config.hpp>

#include <algorithm>
#include <cctype>
#include <future>

#include <drogon/HttpClient.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>
#include <fmt/format.h>

namespace fnbridge::runtime {

  namespace {

    struct Reply {
      drogon::ReqResult result;
      drogon::HttpResponsePtr response;
    };

    // Drogon callbacks must be copyable, hence the shared promise.
    using promise_ptr_t = std::shared_ptr<std::promise<Reply>>;

    common::http::HTTPClient::callback_t deliver(const promise_ptr_t& promise)
    {
      return [promise](drogon::ReqResult result, const drogon::HttpResponsePtr& response) {
        promise->set_value(Reply{result, response});
      };
    }

    std::optional<Reply> wait_for(std::future<Reply>& future, const CancellationToken& token)
    {
      while (future.wait_for(HTTPTransport::WAIT_SLICE) != std::future_status::ready) {
        if (token.cancelled()) {
          return std::nullopt;
        }
      }
      return future.get();
    }

    std::string format_headers(const InvocationEvent::headers_t& headers)
    {
      std::string out;
      for (const auto& [name, value] : headers) {
        if (!out.empty()) {
          out += ", ";
        }
        out += fmt::format("{}: {}", name, value);
      }
      return out;
    }

    bool successful(const drogon::HttpResponsePtr& response)
    {
      int code = static_cast<int>(response->getStatusCode());
      return code >= 200 && code < 300;
    }

  } // namespace

  HTTPTransport::HTTPTransport(const config::Runtime& cfg)
      : _user_agent(RuntimeEndpoint::user_agent(cfg.adapter_version)),
        _request_timeout(cfg.http.request_timeout)
  {
    _logger = common::util::create_logger("HTTPTransport");
  }

  void HTTPTransport::open(const RuntimeEndpoint& endpoint)
  {
    _endpoint = endpoint;
    _client = common::http::HTTPClientFactory::create_client(
        endpoint.address(), -1, _request_timeout
    );
    _client.set_user_agent(_user_agent);

    SPDLOG_LOGGER_DEBUG(_logger, "Event URI: {}, User-Agent: {}", endpoint.next_url(), _user_agent);
  }

  const RuntimeEndpoint& HTTPTransport::_opened_endpoint() const
  {
    if (!_endpoint.has_value()) {
      throw common::HTTPError{"Transport is used before the runtime endpoint is opened!"};
    }
    return _endpoint.value();
  }

  std::optional<InvocationEvent>
  HTTPTransport::poll(LoopState& state, const CancellationToken& token)
  {
    try {

      auto& endpoint = _opened_endpoint();

      auto promise = std::make_shared<std::promise<Reply>>();
      auto future = promise->get_future();
      _client.get(endpoint.next_path(), {}, deliver(promise));

      auto reply = wait_for(future, token);
      if (!reply.has_value()) {
        _logger->info("Polling for the next event was cancelled");
        return std::nullopt;
      }

      if (reply->result != drogon::ReqResult::Ok) {

        if (common::http::HTTPClient::is_socket_failure(reply->result)) {
          _logger->error(
              "Runtime API at {} is unreachable ({}), stopping the event loop",
              endpoint.address(), common::http::HTTPClient::describe(reply->result)
          );
          state.stop();
        } else {
          _logger->warn(
              "Polling for the next event failed: {}",
              common::http::HTTPClient::describe(reply->result)
          );
        }
        return std::nullopt;
      }

      auto& response = reply->response;
      if (!successful(response)) {
        _logger->warn(
            "Polling for the next event returned status {}: {}",
            static_cast<int>(response->getStatusCode()), response->getBody()
        );
        return std::nullopt;
      }

      InvocationEvent event;
      for (const auto& [name, value] : response->headers()) {
        std::string key{name};
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
          return static_cast<char>(std::tolower(c));
        });
        event.headers.emplace(std::move(key), value);
      }
      event.body = std::string{response->getBody()};

      auto request_id = event.header(headers::REQUEST_ID);
      if (!request_id.has_value() || request_id->empty()) {
        _logger->warn("Received an event without the {} header", headers::REQUEST_ID);
        return std::nullopt;
      }
      event.request_id = std::move(request_id.value());
      event.trace_id = event.header(headers::TRACE_ID);
      event.content_type = event.header(headers::CONTENT_TYPE).value_or("");

      SPDLOG_LOGGER_DEBUG(
          _logger, "New event received, request {}, content type {}, {} bytes, headers {}",
          event.request_id, event.content_type, event.body.size(),
          format_headers(event.headers)
      );

      return event;

    } catch (std::exception& exc) {
      _logger->warn("Polling for the next event failed: {}", exc.what());
    }

    return std::nullopt;
  }

  void HTTPTransport::respond(
      const std::string& request_id, const std::string& body, const CancellationToken& token
  )
  {
    auto& endpoint = _opened_endpoint();

    auto promise = std::make_shared<std::promise<Reply>>();
    auto future = promise->get_future();
    _client.post(endpoint.response_path(request_id), {}, body, deliver(promise));

    auto reply = wait_for(future, token);
    if (!reply.has_value()) {
      _logger->info("Response of request {} was cancelled", request_id);
      return;
    }

    if (reply->result != drogon::ReqResult::Ok) {
      throw common::HTTPError{fmt::format(
          "Could not send response of request {} to {}: {}", request_id,
          endpoint.response_url(request_id), common::http::HTTPClient::describe(reply->result)
      )};
    }

    int status = static_cast<int>(reply->response->getStatusCode());
    if (successful(reply->response)) {
      _logger->info("Result POST status of request {}: {}", request_id, status);
    } else {
      _logger->warn(
          "Result POST status of request {}: {}, body {}", request_id, status,
          reply->response->getBody()
      );
    }
  }

  void HTTPTransport::report_error(
      const std::string& request_id, const std::string& body, const CancellationToken& token
  )
  {
    auto promise = std::make_shared<std::promise<Reply>>();
    auto future = promise->get_future();

    std::string url;
    try {
      auto& endpoint = _opened_endpoint();
      url = endpoint.error_url(request_id);
      _client.post_json(endpoint.error_path(request_id), {}, body, deliver(promise));
    } catch (common::HTTPError& exc) {
      throw common::ReportingError{
          fmt::format("Failed to report error of request {}: {}", request_id, exc.what())};
    }

    auto reply = wait_for(future, token);
    if (!reply.has_value()) {
      _logger->info("Error report of request {} was cancelled", request_id);
      return;
    }

    if (reply->result != drogon::ReqResult::Ok) {
      throw common::ReportingError{fmt::format(
          "Failed to report error of request {} to {}: {}", request_id, url,
          common::http::HTTPClient::describe(reply->result)
      )};
    }

    int status = static_cast<int>(reply->response->getStatusCode());
    if (!successful(reply->response)) {
      throw common::ReportingError{fmt::format(
          "Failed to report error of request {} to {}: status {}, body {}", request_id, url,
          status, reply->response->getBody()
      )};
    }

    _logger->info("Result ERROR status of request {}: {}", request_id, status);
  }

} // namespace fnbridge::runtime
