#ifndef FNBRIDGE_RUNTIME_ENDPOINT_HPP
#define FNBRIDGE_RUNTIME_ENDPOINT_HPP

#include <string>
#include <string_view>

namespace fnbridge::runtime {

  /**
   * @brief Addresses of the Runtime API control endpoint.
   *
   * Built once per loop start from the `host:port` value of AWS_LAMBDA_RUNTIME_API.
   * Path variants are relative to address() and are what the HTTP client sends;
   * URL variants are used for logging.
   */
  struct RuntimeEndpoint {

    static constexpr char VERSION[] = "2018-06-01";

    explicit RuntimeEndpoint(std::string runtime_api);

    std::string_view host() const
    {
      return _host;
    }

    std::string address() const;

    std::string next_path() const;
    std::string response_path(std::string_view request_id) const;
    std::string error_path(std::string_view request_id) const;

    std::string next_url() const;
    std::string response_url(std::string_view request_id) const;
    std::string error_url(std::string_view request_id) const;

    // fnbridge/<platform-version>-<adapter-version>
    static std::string user_agent(std::string_view adapter_version);

    static std::string platform_version();

  private:
    std::string _host;
  };

} // namespace fnbridge::runtime

#endif
