#ifndef FNBRIDGE_RUNTIME_RESOLVER_HPP
#define FNBRIDGE_RUNTIME_RESOLVER_HPP

#include <fnbridge/runtime/config.hpp>
#include <fnbridge/runtime/event.hpp>
#include <fnbridge/runtime/functions.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace fnbridge::runtime {

  /**
   * @brief Selects the function handling an event.
   *
   * Sources are tried in a fixed order and the first match wins:
   * DEFAULT_HANDLER, _HANDLER, the registry's default function,
   * the configured function definition and the function definition
   * header of the event. Sources without a value are skipped.
   */
  struct Resolver {

    Resolver(Registry& registry, const config::Runtime& cfg);

    // Throws common::FunctionNotFound listing every source tried and all registered names.
    FunctionPtr locate(const InvocationEvent& event) const;

  private:
    struct Attempt {
      std::string source;
      std::optional<std::string> identifier;
      bool named;
    };

    FunctionPtr _lookup(
        const std::string& source, const std::optional<std::string>& identifier,
        const std::string& content_type, std::vector<Attempt>& attempts
    ) const;

    FunctionPtr _lookup_default(const std::string& content_type, std::vector<Attempt>& attempts) const;

    std::string _failure_message(const std::vector<Attempt>& attempts) const;

    Registry& _registry;
    const config::Runtime& _cfg;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace fnbridge::runtime

#endif
