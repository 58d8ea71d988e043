#include <fnbridge/common/http.hpp>

#include <fnbridge/common/exceptions.hpp>

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <fmt/format.h>
#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThreadPool.h>

namespace fnbridge::common::http {

  std::unique_ptr<trantor::EventLoopThreadPool> HTTPClientFactory::_pool = nullptr;

  HTTPClient::HTTPClient() : _timeout(0), _http_client(nullptr) {}

  HTTPClient::HTTPClient(const std::string& address, trantor::EventLoop* loop, double timeout)
      : _timeout(timeout)
  {
    this->_http_client = drogon::HttpClient::newHttpClient(address, loop, false, false);
  }

  void HTTPClient::set_user_agent(const std::string& user_agent)
  {
    _http_client->setUserAgent(user_agent);
  }

  std::shared_ptr<drogon::HttpRequest>
  HTTPClient::get(const std::string& path, headers_t&& headers, callback_t&& callback)
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath(path);
    request(req, std::forward<headers_t>(headers), std::forward<callback_t>(callback));

    return req;
  }

  std::shared_ptr<drogon::HttpRequest> HTTPClient::post(
      const std::string& path, headers_t&& headers, std::string body, callback_t&& callback
  )
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath(path);
    req->setBody(std::move(body));
    request(req, std::forward<headers_t>(headers), std::forward<callback_t>(callback));

    return req;
  }

  std::shared_ptr<drogon::HttpRequest> HTTPClient::post_json(
      const std::string& path, headers_t&& headers, std::string body, callback_t&& callback
  )
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath(path);
    req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    req->setBody(std::move(body));
    request(req, std::forward<headers_t>(headers), std::forward<callback_t>(callback));

    return req;
  }

  void HTTPClient::request(
      std::shared_ptr<drogon::HttpRequest>& req, headers_t&& headers, callback_t&& callback
  )
  {
    if (!_http_client) {
      throw common::HTTPError("HTTP client is not connected!");
    }

    for (const auto& header : headers) {
      req->addHeader(header.first, header.second);
    }
    _http_client->sendRequest(req, std::move(callback), _timeout);
  }

  bool HTTPClient::is_socket_failure(drogon::ReqResult result)
  {
    return result == drogon::ReqResult::NetworkFailure ||
           result == drogon::ReqResult::BadServerAddress;
  }

  std::string_view HTTPClient::describe(drogon::ReqResult result)
  {
    switch (result) {
    case drogon::ReqResult::Ok:
      return "ok";
    case drogon::ReqResult::BadResponse:
      return "bad response";
    case drogon::ReqResult::NetworkFailure:
      return "network failure";
    case drogon::ReqResult::BadServerAddress:
      return "bad server address";
    case drogon::ReqResult::Timeout:
      return "timeout";
    default:
      return "unknown failure";
    }
  }

  void HTTPClientFactory::initialize(int thread_num)
  {
    HTTPClientFactory::_pool = std::make_unique<trantor::EventLoopThreadPool>(thread_num);
    HTTPClientFactory::_pool->start();
  }

  void HTTPClientFactory::shutdown()
  {
    HTTPClientFactory::_pool.reset();
  }

  HTTPClient HTTPClientFactory::create_client(std::string address, int port, double timeout)
  {
    if (!_pool) {
      throw common::FnBridgeException("Uninitialized HTTPClientFactory!");
    }

    if (port != -1) {
      return HTTPClient{fmt::format("{}:{}", address, port), _pool->getNextLoop(), timeout};
    } else {
      return HTTPClient{address, _pool->getNextLoop(), timeout};
    }
  }

} // namespace fnbridge::common::http
