#include <fnbridge/runtime/resolver.hpp>

#include <fnbridge/common/exceptions.hpp>
#include <fnbridge/common/util.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fnbridge::runtime {

  Resolver::Resolver(Registry& registry, const config::Runtime& cfg)
      : _registry(registry), _cfg(cfg)
  {
    _logger = common::util::create_logger("Resolver");
  }

  FunctionPtr Resolver::_lookup(
      const std::string& source, const std::optional<std::string>& identifier,
      const std::string& content_type, std::vector<Attempt>& attempts
  ) const
  {
    attempts.push_back(Attempt{source, identifier, true});
    SPDLOG_LOGGER_DEBUG(_logger, "Value of {}: {}", source, identifier.value_or("<unset>"));

    if (!identifier.has_value() || identifier->empty()) {
      return nullptr;
    }

    return _registry.lookup(identifier, content_type);
  }

  FunctionPtr Resolver::_lookup_default(
      const std::string& content_type, std::vector<Attempt>& attempts
  ) const
  {
    attempts.push_back(Attempt{"default function", std::nullopt, false});
    return _registry.lookup(std::nullopt, content_type);
  }

  FunctionPtr Resolver::locate(const InvocationEvent& event) const
  {
    const std::string& content_type = event.content_type;
    std::vector<Attempt> attempts;

    auto function =
        _lookup(config::Runtime::ENV_DEFAULT_HANDLER, _cfg.default_handler, content_type, attempts);

    if (!function) {
      SPDLOG_LOGGER_DEBUG(_logger, "Could not locate function under DEFAULT_HANDLER");
      function = _lookup(config::Runtime::ENV_HANDLER, _cfg.handler, content_type, attempts);
    }

    if (!function) {
      SPDLOG_LOGGER_DEBUG(_logger, "Could not locate function under _HANDLER");
      function = _lookup_default(content_type, attempts);
    }

    if (!function) {
      _logger->info("Could not determine default function");
      function = _lookup(
          fmt::format("'{}' configuration", config::Runtime::FUNCTION_DEFINITION),
          _cfg.function_definition, content_type, attempts
      );
    }

    if (!function) {
      _logger->info(
          "Could not determine DEFAULT_HANDLER, _HANDLER or '{}'",
          config::Runtime::FUNCTION_DEFINITION
      );
      function = _lookup(
          fmt::format("'{}' header", headers::FUNCTION_DEFINITION),
          event.header(headers::FUNCTION_DEFINITION), content_type, attempts
      );
    }

    if (!function) {
      throw common::FunctionNotFound{_failure_message(attempts)};
    }

    _logger->info("Located function {} for request {}", function->definition(), event.request_id);
    return function;
  }

  std::string Resolver::_failure_message(const std::vector<Attempt>& attempts) const
  {
    std::vector<std::string> tried;
    for (const auto& attempt : attempts) {
      if (!attempt.named) {
        tried.emplace_back(attempt.source);
      } else {
        tried.emplace_back(
            fmt::format("{} = '{}'", attempt.source, attempt.identifier.value_or("<unset>"))
        );
      }
    }

    return fmt::format(
        "Failed to locate function. Tried: {}. Functions available in catalog are: [{}]",
        fmt::join(tried, ", "), fmt::join(_registry.names(), ", ")
    );
  }

} // namespace fnbridge::runtime
