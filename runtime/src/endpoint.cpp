#include <fnbridge/runtime/endpoint.hpp>

#include <fnbridge/common/exceptions.hpp>

#include <fmt/format.h>

namespace fnbridge::runtime {

  RuntimeEndpoint::RuntimeEndpoint(std::string runtime_api) : _host(std::move(runtime_api))
  {
    if (_host.empty()) {
      throw common::InvalidConfigurationError{"Runtime API address is not set!"};
    }
  }

  std::string RuntimeEndpoint::address() const
  {
    return fmt::format("http://{}", _host);
  }

  std::string RuntimeEndpoint::next_path() const
  {
    return fmt::format("/{}/runtime/invocation/next", VERSION);
  }

  std::string RuntimeEndpoint::response_path(std::string_view request_id) const
  {
    return fmt::format("/{}/runtime/invocation/{}/response", VERSION, request_id);
  }

  std::string RuntimeEndpoint::error_path(std::string_view request_id) const
  {
    return fmt::format("/{}/runtime/invocation/{}/error", VERSION, request_id);
  }

  std::string RuntimeEndpoint::next_url() const
  {
    return address() + next_path();
  }

  std::string RuntimeEndpoint::response_url(std::string_view request_id) const
  {
    return address() + response_path(request_id);
  }

  std::string RuntimeEndpoint::error_url(std::string_view request_id) const
  {
    return address() + error_path(request_id);
  }

  std::string RuntimeEndpoint::user_agent(std::string_view adapter_version)
  {
    return fmt::format("fnbridge/{}-{}", platform_version(), adapter_version);
  }

  std::string RuntimeEndpoint::platform_version()
  {
#if defined(__clang__)
    return fmt::format("clang{}.{}.{}", __clang_major__, __clang_minor__, __clang_patchlevel__);
#elif defined(__GNUC__)
    return fmt::format("gcc{}.{}.{}", __GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__);
#else
    return fmt::format("cxx{}", __cplusplus);
#endif
  }

} // namespace fnbridge::runtime
