#ifndef FNBRIDGE_COMMON_HTTP_HPP
#define FNBRIDGE_COMMON_HTTP_HPP

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace drogon {
  struct HttpRequest;
  struct HttpResponse;
  enum class ReqResult;
  struct HttpClient;
} // namespace drogon

namespace trantor {
  struct EventLoop;
  struct EventLoopThreadPool;
} // namespace trantor

namespace fnbridge::common::http {

  struct HTTPClient {

    using request_ptr_t = std::shared_ptr<drogon::HttpRequest>;
    using response_ptr_t = std::shared_ptr<drogon::HttpResponse>;
    using headers_t = std::initializer_list<std::pair<std::string, std::string>>;
    using callback_t =
        std::function<void(drogon::ReqResult, const std::shared_ptr<drogon::HttpResponse>&)>;

    HTTPClient();

    HTTPClient(const std::string& address, trantor::EventLoop* loop, double timeout = 0);

    void set_user_agent(const std::string& user_agent);

    request_ptr_t get(const std::string& path, headers_t&& headers, callback_t&& callback);

    request_ptr_t post(
        const std::string& path, headers_t&& headers, std::string body, callback_t&& callback
    );

    request_ptr_t post_json(
        const std::string& path, headers_t&& headers, std::string body, callback_t&& callback
    );

    // Connection refused, reset or closed: the remote end is gone.
    static bool is_socket_failure(drogon::ReqResult result);

    static std::string_view describe(drogon::ReqResult result);

  private:
    void request(request_ptr_t& req, headers_t&& headers, callback_t&& callback);

    double _timeout;
    std::shared_ptr<drogon::HttpClient> _http_client;
  };

  struct HTTPClientFactory {

    static void initialize(int thread_num);
    static void shutdown();

    static HTTPClient create_client(std::string address, int port = -1, double timeout = 0);

  private:
    static std::unique_ptr<trantor::EventLoopThreadPool> _pool;
  };

} // namespace fnbridge::common::http

#endif
